#ifndef PULSEGRAPH_SIGNAL_RECORDER_H
#define PULSEGRAPH_SIGNAL_RECORDER_H

#include <pulsegraph/types/node.h>

#include <deque>

namespace pulsegraph {
    /**
     * Keeps the last ``capacity`` chunks it received. Published buffers are immutable, so the recorder holds on to
     * them rather than copying.
     */
    struct PULSEGRAPH_EXPORT SignalRecorder : OutputNode {
        using ptr = SignalRecorder*;
        using s_ptr = std::shared_ptr<SignalRecorder>;

        explicit SignalRecorder(size_t capacity = 100);

        [[nodiscard]] size_t capacity() const;

        void set_capacity(size_t capacity);

        [[nodiscard]] const std::deque<signal_buffer_s_ptr> &recording() const;

        [[nodiscard]] size_t recorded_samples() const;

        [[nodiscard]] const std::vector<std::string> &channel_names() const;

        [[nodiscard]] const attribute_names_t &reset_attributes() const override;

        [[nodiscard]] const upstream_dependencies_t &reinitialization_dependencies() const override;

    protected:
        void do_initialize() override;

        void do_update() override;

        bool do_reset() override;

        void do_on_input_history_invalidation() override;

    private:
        void trim();

        size_t _capacity;
        std::vector<std::string> _channel_names;
        std::deque<signal_buffer_s_ptr> _recording;
    };
} // namespace pulsegraph

#endif // PULSEGRAPH_SIGNAL_RECORDER_H
