#pragma once

#include <chrono>


namespace wikirace::core::config::cursor {

// -----------------------------------------------------------------------------
// Remote cursor smoothing
// -----------------------------------------------------------------------------
inline constexpr double LERP_FACTOR = 0.3;               // fraction moved per tick
inline constexpr double RESIZE_RESET_THRESHOLD_PX = 1.0;  // width change that drops smoothing state

// -----------------------------------------------------------------------------
// Outgoing sample rate (pointer path)
// -----------------------------------------------------------------------------
inline constexpr double FAST_DISTANCE_PX   = 20.0;
inline constexpr double MEDIUM_DISTANCE_PX = 5.0;

inline constexpr std::chrono::milliseconds FAST_INTERVAL{16};
inline constexpr std::chrono::milliseconds MEDIUM_INTERVAL{25};
inline constexpr std::chrono::milliseconds SLOW_INTERVAL{50};

// -----------------------------------------------------------------------------
// Scroll-only resend path (~30 Hz)
// -----------------------------------------------------------------------------
inline constexpr std::chrono::milliseconds SCROLL_INTERVAL{33};
inline constexpr double SCROLL_MIN_DELTA_PX = 1.0;

} // namespace wikirace::core::config::cursor
