#ifndef PULSEGRAPH_CALLBACK_OUTPUT_H
#define PULSEGRAPH_CALLBACK_OUTPUT_H

#include <pulsegraph/types/node.h>

#include <functional>

namespace pulsegraph {
    /**
     * Hands every non-empty input, along with the channel info describing it, to a sink (e.g. a plot or a
     * network sender). The buffer is only valid for the duration of the call.
     */
    struct PULSEGRAPH_EXPORT CallbackOutput : OutputNode {
        using ptr = CallbackOutput*;
        using s_ptr = std::shared_ptr<CallbackOutput>;
        using sink_t = std::function<void(const ChannelInfo &, const SignalBuffer &)>;

        explicit CallbackOutput(sink_t sink);

        [[nodiscard]] const std::optional<ChannelInfo> &channel_info() const;

        [[nodiscard]] const attribute_names_t &reset_attributes() const override;

        [[nodiscard]] const upstream_dependencies_t &reinitialization_dependencies() const override;

    protected:
        void do_initialize() override;

        void do_update() override;

        bool do_reset() override;

        void do_on_input_history_invalidation() override;

    private:
        sink_t _sink;
        std::optional<ChannelInfo> _channel_info;
    };
} // namespace pulsegraph

#endif // PULSEGRAPH_CALLBACK_OUTPUT_H
