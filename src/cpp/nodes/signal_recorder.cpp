#include <pulsegraph/nodes/signal_recorder.h>

namespace pulsegraph {
    SignalRecorder::SignalRecorder(size_t capacity) : OutputNode("SignalRecorder"), _capacity{capacity} {
        if (capacity == 0) { throw_error<ValidationError>("SignalRecorder capacity must be positive"); }
    }

    size_t SignalRecorder::capacity() const { return _capacity; }

    void SignalRecorder::set_capacity(size_t capacity) {
        if (capacity == 0) {
            throw_error<ValidationError>("The capacity of the {} node must be positive", str());
        }
        _capacity = capacity;
        mark_reset_needed();
    }

    const std::deque<signal_buffer_s_ptr> &SignalRecorder::recording() const { return _recording; }

    size_t SignalRecorder::recorded_samples() const {
        size_t samples{0};
        for (const auto &chunk: _recording) { samples += chunk->sample_count(); }
        return samples;
    }

    const std::vector<std::string> &SignalRecorder::channel_names() const { return _channel_names; }

    const attribute_names_t &SignalRecorder::reset_attributes() const {
        static const attribute_names_t names{"capacity"};
        return names;
    }

    const upstream_dependencies_t &SignalRecorder::reinitialization_dependencies() const {
        static const upstream_dependencies_t dependencies{
            {std::string{CHANNEL_INFO_ATTRIBUTE}, reduce_to_channel_labels}
        };
        return dependencies;
    }

    void SignalRecorder::do_initialize() {
        _channel_names = upstream_channel_info().channel_names();
        _recording.clear();
    }

    void SignalRecorder::do_update() {
        _recording.push_back(input());
        trim();
    }

    // A smaller capacity only drops the oldest chunks, what is left is still a valid recording
    bool SignalRecorder::do_reset() {
        trim();
        return false;
    }

    void SignalRecorder::do_on_input_history_invalidation() { _recording.clear(); }

    void SignalRecorder::trim() {
        while (_recording.size() > _capacity) { _recording.pop_front(); }
    }
} // namespace pulsegraph
