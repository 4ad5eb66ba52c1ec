#pragma once

#include <pulsegraph/runtime/lifecycle_observer.h>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace pulsegraph {

    /**
     * @brief Logs out the life-cycle steps as the pipeline runs.
     *
     * Update events are voluminous (one line per node per tick) and are off by default, they can be helpful tracing
     * down why a node did or did not produce an output.
     */
    class PULSEGRAPH_EXPORT EvaluationTrace : public PipelineLifeCycleObserver {
    public:
        /**
         * @brief Construct a new Evaluation Trace object
         *
         * @param filter Used to restrict which node events to report (substring match on the node name)
         * @param initialize Log initialisation events
         * @param reset Log reset and history invalidation events
         * @param update Log update events
         * @param tick Log pipeline tick events
         * @param out Where to write to, when not provided the stream is chosen by ``set_use_logger``
         */
        explicit EvaluationTrace(std::optional<std::string> filter = std::nullopt, bool initialize = true,
                                 bool reset = true, bool update = false, bool tick = true,
                                 std::ostream *out = nullptr);

        void on_before_initialize_pipeline(Pipeline &pipeline) override;
        void on_after_initialize_pipeline(Pipeline &pipeline) override;
        void on_before_tick(Pipeline &pipeline) override;
        void on_after_tick(Pipeline &pipeline) override;
        void on_before_node_initialize(Node &node) override;
        void on_after_node_initialize(Node &node) override;
        void on_before_node_update(Node &node) override;
        void on_after_node_update(Node &node) override;
        void on_before_node_reset(Node &node) override;
        void on_before_node_history_invalidation(Node &node) override;

        // Static configuration
        static void set_use_logger(bool value);

    private:
        std::optional<std::string> _filter;
        bool _initialize;
        bool _reset;
        bool _update;
        bool _tick;
        std::ostream *_out;
        int64_t _tick_count{0};

        static bool _use_logger;

        void _print(const std::string &msg) const;
        void _print_node(const Node &node, const std::string &msg) const;
        bool _should_log_node(const Node &node) const;
    };

} // namespace pulsegraph
