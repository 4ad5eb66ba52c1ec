#pragma once

#include <pulsegraph/runtime/lifecycle_observer.h>
#include <pulsegraph/util/date_time.h>

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace pulsegraph {

    struct NodeProfile {
        int64_t initialize_count{0};
        int64_t update_count{0};
        int64_t reset_count{0};
        int64_t history_invalidation_count{0};
        engine_time_delta_t initialize_time{0};
        engine_time_delta_t update_time{0};
        engine_time_delta_t reset_time{0};
        engine_time_delta_t history_invalidation_time{0};
        engine_time_delta_t max_update_time{0};
    };

    /**
     * @brief Measures how long each life-cycle hook and each tick takes.
     *
     * Per node statistics are keyed by the node's ``str()``. Update times include any initialisation or reset
     * the update resolved.
     */
    class PULSEGRAPH_EXPORT EvaluationProfiler : public PipelineLifeCycleObserver {
    public:
        /**
         * @brief Construct a new Evaluation Profiler object
         *
         * @param print Print the initialisation and tick timings as they complete
         * @param out Where to print to, std::cout when not provided
         */
        explicit EvaluationProfiler(bool print = true, std::ostream *out = nullptr);

        void on_before_initialize_pipeline(Pipeline &pipeline) override;
        void on_after_initialize_pipeline(Pipeline &pipeline) override;
        void on_before_tick(Pipeline &pipeline) override;
        void on_after_tick(Pipeline &pipeline) override;
        void on_before_node_initialize(Node &node) override;
        void on_after_node_initialize(Node &node) override;
        void on_before_node_update(Node &node) override;
        void on_after_node_update(Node &node) override;
        void on_before_node_reset(Node &node) override;
        void on_after_node_reset(Node &node) override;
        void on_before_node_history_invalidation(Node &node) override;
        void on_after_node_history_invalidation(Node &node) override;

        [[nodiscard]] const std::map<std::string, NodeProfile> &profiles() const;

        /**
         * The statistics of the node with the given name, nullptr if it was never observed.
         */
        [[nodiscard]] const NodeProfile *profile(const std::string &node_name) const;

        [[nodiscard]] int64_t tick_count() const;

        [[nodiscard]] engine_time_delta_t total_tick_time() const;

        [[nodiscard]] engine_time_delta_t max_tick_time() const;

        [[nodiscard]] engine_time_delta_t initialization_time() const;

    private:
        bool _print_enabled;
        std::ostream *_out;
        std::vector<engine_time_t> _start_times;
        std::map<std::string, NodeProfile> _profiles;
        int64_t _tick_count{0};
        engine_time_delta_t _total_tick_time{0};
        engine_time_delta_t _max_tick_time{0};
        engine_time_delta_t _initialization_time{0};

        void _print(const std::string &msg) const;
        void _start();
        engine_time_delta_t _stop();
    };

} // namespace pulsegraph
