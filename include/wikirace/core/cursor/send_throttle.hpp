#pragma once

#include "wikirace/core/clock.hpp"
#include "wikirace/core/config/cursor.hpp"


namespace wikirace::core::cursor {

// Adaptive rate limiter for outgoing cursor samples.
//
// Pointer path: the minimum interval shrinks with travel since the last sent
// sample (>20 px: 16 ms, >5 px: 25 ms, else 50 ms).
// Scroll path: re-sends a stationary pointer whose content-relative position
// moved because the page scrolled, at most every 33 ms and only when the
// position changed by more than 1 px on either axis.
//
// Both paths share the last-sent timestamp and position.
class SendThrottle {
public:
    SendThrottle() = default;

    // Returns true (and records the sample) when a pointer sample may go out
    [[nodiscard]] bool on_pointer(TimePoint now, double x, double y) noexcept;

    // Returns true (and records the sample) when a scroll resend may go out
    [[nodiscard]] bool on_scroll(TimePoint now, double x, double y) noexcept;

    // Minimum interval for a pointer sample that moved `distance` px
    [[nodiscard]] static Millis interval_for(double distance) noexcept;

    void reset() noexcept;

    [[nodiscard]] bool has_sent() const noexcept { return has_sent_; }
    [[nodiscard]] double last_x() const noexcept { return last_x_; }
    [[nodiscard]] double last_y() const noexcept { return last_y_; }

private:
    bool has_sent_{false};
    TimePoint last_sent_{};
    double last_x_{0.0};
    double last_y_{0.0};

private:
    void record_(TimePoint now, double x, double y) noexcept;
};

} // namespace wikirace::core::cursor
