#include "wikirace/core/race/splits.hpp"

#include <cstdio>

#include "wikirace/core/race/title.hpp"


namespace wikirace::core::race {

std::string format_race_time(std::int64_t ms) {
    if (ms < 0) {
        ms = 0;
    }
    const std::int64_t centis  = ms / 10;
    const std::int64_t hours   = centis / 360000;
    const std::int64_t minutes = (centis % 360000) / 6000;
    const std::int64_t seconds = (centis % 6000) / 100;
    const std::int64_t cc      = centis % 100;

    char buf[48];
    if (hours > 0) {
        std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld.%02lld",
                      static_cast<long long>(hours), static_cast<long long>(minutes),
                      static_cast<long long>(seconds), static_cast<long long>(cc));
    } else {
        std::snprintf(buf, sizeof(buf), "%lld:%02lld.%02lld",
                      static_cast<long long>(minutes), static_cast<long long>(seconds),
                      static_cast<long long>(cc));
    }
    return buf;
}

std::string format_split_delta(std::int64_t ms) {
    if (ms < 0) {
        ms = 0;
    }
    // Splits are measured on the centisecond display clock
    const double total_seconds = static_cast<double>(ms / 10) / 100.0;
    const auto minutes = static_cast<long long>(total_seconds / 60.0);
    const double seconds = total_seconds - static_cast<double>(minutes) * 60.0;

    char buf[48];
    if (minutes > 0) {
        char sec[16];
        std::snprintf(sec, sizeof(sec), "%.1f", seconds);
        std::snprintf(buf, sizeof(buf), "+%lld:%4s", minutes, sec);
        for (char* p = buf; *p; ++p) {
            if (*p == ' ') *p = '0';
        }
    } else {
        std::snprintf(buf, sizeof(buf), "+%.1f", seconds);
    }
    return buf;
}

const Segment& SplitTracker::add(std::string_view article, std::int64_t elapsed_ms) {
    const std::int64_t delta = elapsed_ms - last_ms_;
    last_ms_ = elapsed_ms;
    ++count_;

    for (auto& s : segments_) {
        s.is_current = false;
    }

    Segment seg;
    seg.name = display_title(article);
    seg.delta = format_split_delta(delta);
    seg.cumulative = format_race_time(elapsed_ms);
    seg.cumulative_ms = elapsed_ms;
    seg.is_current = true;
    seg.is_ahead = delta < config::race::AHEAD_THRESHOLD.count();
    segments_.push_back(std::move(seg));

    while (segments_.size() > config::race::MAX_SEGMENTS) {
        segments_.pop_front();
    }
    return segments_.back();
}

void SplitTracker::clear() noexcept {
    segments_.clear();
    last_ms_ = 0;
    count_ = 0;
}

} // namespace wikirace::core::race
