#include "wikirace/core/cursor/send_throttle.hpp"

#include <cmath>


namespace wikirace::core::cursor {

Millis SendThrottle::interval_for(double distance) noexcept {
    if (distance > config::cursor::FAST_DISTANCE_PX) {
        return config::cursor::FAST_INTERVAL;
    }
    if (distance > config::cursor::MEDIUM_DISTANCE_PX) {
        return config::cursor::MEDIUM_INTERVAL;
    }
    return config::cursor::SLOW_INTERVAL;
}

bool SendThrottle::on_pointer(TimePoint now, double x, double y) noexcept {
    const double dx = x - last_x_;
    const double dy = y - last_y_;
    const double distance = std::sqrt(dx * dx + dy * dy);

    if (has_sent_ && (now - last_sent_) < interval_for(distance)) {
        return false;
    }
    record_(now, x, y);
    return true;
}

bool SendThrottle::on_scroll(TimePoint now, double x, double y) noexcept {
    if (has_sent_ && (now - last_sent_) < config::cursor::SCROLL_INTERVAL) {
        return false;
    }
    const double dx = std::abs(x - last_x_);
    const double dy = std::abs(y - last_y_);
    if (dx <= config::cursor::SCROLL_MIN_DELTA_PX && dy <= config::cursor::SCROLL_MIN_DELTA_PX) {
        return false;
    }
    record_(now, x, y);
    return true;
}

void SendThrottle::reset() noexcept {
    has_sent_ = false;
    last_sent_ = TimePoint{};
    last_x_ = 0.0;
    last_y_ = 0.0;
}

void SendThrottle::record_(TimePoint now, double x, double y) noexcept {
    has_sent_ = true;
    last_sent_ = now;
    last_x_ = x;
    last_y_ = y;
}

} // namespace wikirace::core::cursor
