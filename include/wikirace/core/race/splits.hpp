#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>

#include "wikirace/core/config/race.hpp"


namespace wikirace::core::race {

// "m:ss.cc" below one hour, "h:mm:ss.cc" otherwise
[[nodiscard]] std::string format_race_time(std::int64_t ms);

// "+s.s" below one minute, "+m:ss.s" otherwise
[[nodiscard]] std::string format_split_delta(std::int64_t ms);

struct Segment {
    std::string name;           // article title, underscores shown as spaces
    std::string delta;          // time since the previous segment
    std::string cumulative;     // race time at arrival
    std::int64_t cumulative_ms{0};
    bool is_current{false};
    bool is_ahead{false};       // delta under the ahead threshold
};

// Speedrun-style split list: one segment per navigation, newest last,
// capped at config::race::MAX_SEGMENTS entries.
class SplitTracker {
public:
    SplitTracker() = default;

    const Segment& add(std::string_view article, std::int64_t elapsed_ms);

    [[nodiscard]] const std::deque<Segment>& segments() const noexcept { return segments_; }

    // Total navigations recorded, including segments already evicted
    [[nodiscard]] std::size_t count() const noexcept { return count_; }

    void clear() noexcept;

private:
    std::deque<Segment> segments_;
    std::int64_t last_ms_{0};
    std::size_t count_{0};
};

} // namespace wikirace::core::race
