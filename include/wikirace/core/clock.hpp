#pragma once

#include <chrono>
#include <cstdint>


namespace wikirace::core {

// Monotonic clock driving every timer-like state in the core.
// Callers pass `now` explicitly so that tests can drive time by hand.
using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis    = std::chrono::milliseconds;

[[nodiscard]]
inline std::int64_t to_millis(Clock::duration d) noexcept {
    return std::chrono::duration_cast<Millis>(d).count();
}

} // namespace wikirace::core
