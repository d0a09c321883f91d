#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace mycelium::util {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

// Injectable monotonic clock; supervisors take one so tests can drive time
using ClockFn = std::function<TimePoint()>;

inline TimePoint steady_now() {
    return SteadyClock::now();
}

// Wall clock in milliseconds, used for envelope timestamps and heartbeats
inline int64_t wall_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline int64_t elapsed_ms(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // namespace mycelium::util
