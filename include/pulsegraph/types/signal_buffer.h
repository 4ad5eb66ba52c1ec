#ifndef PULSEGRAPH_SIGNAL_BUFFER_H
#define PULSEGRAPH_SIGNAL_BUFFER_H

#include <pulsegraph/pulsegraph_base.h>

#include <cstddef>
#include <span>

namespace pulsegraph {
    // Axis convention is fixed for the whole process: channels x samples.
    inline constexpr std::size_t CHANNEL_AXIS = 0;
    inline constexpr std::size_t TIME_AXIS = 1;

    /**
     * A dense 2-D block of samples, stored row-major with one row per channel.
     *
     * Once published as a node output (as a ``signal_buffer_s_ptr``) a buffer is never modified again. Nodes
     * publish a fresh buffer on every update, so a listener that holds on to an old pointer keeps a consistent
     * (if stale) snapshot rather than observing a buffer being rewritten underneath it.
     */
    struct PULSEGRAPH_EXPORT SignalBuffer {
        SignalBuffer() = default;

        SignalBuffer(std::size_t channel_count, std::size_t sample_count, double fill = 0.0);

        SignalBuffer(std::size_t channel_count, std::size_t sample_count, std::vector<double> data);

        [[nodiscard]] std::size_t channel_count() const noexcept { return _channel_count; }

        [[nodiscard]] std::size_t sample_count() const noexcept { return _sample_count; }

        [[nodiscard]] std::size_t size() const noexcept { return _data.size(); }

        [[nodiscard]] bool empty() const noexcept { return _data.empty(); }

        [[nodiscard]] double &operator()(std::size_t channel, std::size_t sample) {
            return _data[channel * _sample_count + sample];
        }

        [[nodiscard]] double operator()(std::size_t channel, std::size_t sample) const {
            return _data[channel * _sample_count + sample];
        }

        [[nodiscard]] std::span<const double> channel(std::size_t channel) const;

        [[nodiscard]] std::span<double> channel(std::size_t channel);

        [[nodiscard]] const std::vector<double> &data() const noexcept { return _data; }

        bool operator==(const SignalBuffer &) const = default;

    private:
        std::size_t _channel_count{0};
        std::size_t _sample_count{0};
        std::vector<double> _data;
    };

    // An absent output and a zero sized one both mean "nothing to emit this tick".
    [[nodiscard]] inline bool is_empty(const signal_buffer_s_ptr &buffer) noexcept {
        return buffer == nullptr || buffer->empty();
    }
} // namespace pulsegraph

#endif // PULSEGRAPH_SIGNAL_BUFFER_H
