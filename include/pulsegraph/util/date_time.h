#ifndef PULSEGRAPH_DATE_TIME_H
#define PULSEGRAPH_DATE_TIME_H

#include <chrono>

namespace pulsegraph {
    // The engine has no clock of its own, these are only used to measure how long the hooks take.
    using engine_clock = std::chrono::steady_clock;
    using engine_time_t = engine_clock::time_point;
    using engine_time_delta_t = std::chrono::microseconds;

    inline engine_time_t engine_now() noexcept { return engine_clock::now(); }

    inline engine_time_delta_t elapsed_since(engine_time_t start) noexcept {
        return std::chrono::duration_cast<engine_time_delta_t>(engine_clock::now() - start);
    }

    constexpr double to_milliseconds(engine_time_delta_t delta) noexcept {
        return std::chrono::duration<double, std::milli>(delta).count();
    }
} // namespace pulsegraph

#endif // PULSEGRAPH_DATE_TIME_H
