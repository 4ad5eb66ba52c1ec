#include <pulsegraph/types/signal_buffer.h>

namespace pulsegraph {
    SignalBuffer::SignalBuffer(std::size_t channel_count, std::size_t sample_count, double fill)
        : _channel_count{channel_count}, _sample_count{sample_count}, _data(channel_count * sample_count, fill) {
    }

    SignalBuffer::SignalBuffer(std::size_t channel_count, std::size_t sample_count, std::vector<double> data)
        : _channel_count{channel_count}, _sample_count{sample_count}, _data{std::move(data)} {
        if (_data.size() != _channel_count * _sample_count) {
            throw_error<ValidationError>("SignalBuffer of shape {}x{} requires {} values, got {}", _channel_count,
                                         _sample_count, _channel_count * _sample_count, _data.size());
        }
    }

    std::span<const double> SignalBuffer::channel(std::size_t channel) const {
        if (channel >= _channel_count) {
            throw std::out_of_range(fmt::format("Channel {} out of range [0, {})", channel, _channel_count));
        }
        return {_data.data() + channel * _sample_count, _sample_count};
    }

    std::span<double> SignalBuffer::channel(std::size_t channel) {
        if (channel >= _channel_count) {
            throw std::out_of_range(fmt::format("Channel {} out of range [0, {})", channel, _channel_count));
        }
        return {_data.data() + channel * _sample_count, _sample_count};
    }
} // namespace pulsegraph
