#include <pulsegraph/nodes/callback_output.h>

namespace pulsegraph {
    CallbackOutput::CallbackOutput(sink_t sink) : OutputNode("CallbackOutput"), _sink{std::move(sink)} {
        if (!_sink) { throw_error<ValidationError>("CallbackOutput requires a sink"); }
    }

    const std::optional<ChannelInfo> &CallbackOutput::channel_info() const { return _channel_info; }

    const attribute_names_t &CallbackOutput::reset_attributes() const {
        static const attribute_names_t none{};
        return none;
    }

    // The sink gets the full channel info, so any change to it (bad channels included) is a reinitialisation
    const upstream_dependencies_t &CallbackOutput::reinitialization_dependencies() const {
        static const upstream_dependencies_t dependencies{UpstreamDependency{std::string{CHANNEL_INFO_ATTRIBUTE}}};
        return dependencies;
    }

    void CallbackOutput::do_initialize() { _channel_info = upstream_channel_info(); }

    void CallbackOutput::do_update() { _sink(*_channel_info, *input()); }

    bool CallbackOutput::do_reset() { return false; }

    void CallbackOutput::do_on_input_history_invalidation() {
    }
} // namespace pulsegraph
