#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>

#include "wikirace/core/clock.hpp"
#include "lcr/optional.hpp"


namespace wikirace::core::race {

enum class LocalState {
    Idle,       // article content not loaded yet
    Running,
    Finished
};

enum class RaceState {
    InProgress,     // nobody finished yet
    GracePeriod,    // first finish observed, countdown pending or running
    Closed          // countdown elapsed
};

[[nodiscard]]
inline constexpr std::string_view to_string(LocalState s) noexcept {
    switch (s) {
        case LocalState::Idle:     return "Idle";
        case LocalState::Running:  return "Running";
        case LocalState::Finished: return "Finished";
    }
    return "Unknown";
}

[[nodiscard]]
inline constexpr std::string_view to_string(RaceState s) noexcept {
    switch (s) {
        case RaceState::InProgress:  return "InProgress";
        case RaceState::GracePeriod: return "GracePeriod";
        case RaceState::Closed:      return "Closed";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, LocalState s) { return os << to_string(s); }
inline std::ostream& operator<<(std::ostream& os, RaceState s) { return os << to_string(s); }

/*
===============================================================================
 race::Timer
===============================================================================

Local player:   Idle --start()--> Running --destination reached--> Finished
Race:           InProgress --first finish seen--> GracePeriod --30 s--> Closed

- start() captures the local start timestamp the first time only.
- The local finish is one-shot: once reached, later evaluations never fire
  again, even if the destination condition is re-evaluated.
- race_ended_at is recorded by the first observed finish (local or remote)
  and never overwritten.
- The countdown is a pure function of `now`:
      remaining = GRACE_PERIOD - (now - (race_ended_at + NOTIFICATION_DELAY))
  so a late or missed tick can never desynchronize it.
- poll(now) reports, exactly once, that a still-running local player must
  be forced into the results view ("did not finish").
===============================================================================
*/
class Timer {
public:
    Timer() = default;

    // Idle -> Running on first article load. Returns true on the transition.
    bool start(TimePoint now) noexcept;

    // Evaluates the destination condition for the local player.
    // Returns the elapsed race time (ms) the one time the finish fires.
    [[nodiscard]]
    lcr::optional<std::int64_t> on_local_article(std::string_view article, std::string_view destination, TimePoint now);

    // Records the first finish of the race. Returns true if this call started
    // the grace period.
    bool on_finish_observed(TimePoint now) noexcept;

    // True exactly once: the grace period closed while the local player was
    // still running.
    [[nodiscard]] bool poll(TimePoint now) noexcept;

    // Whole seconds left on the countdown (rounded up, never negative).
    // Full grace period while the countdown has not started, 0 once closed.
    [[nodiscard]] std::int64_t countdown_seconds(TimePoint now) const noexcept;

    [[nodiscard]] std::int64_t countdown_remaining_ms(TimePoint now) const noexcept;

    // True once the post-finish display delay has elapsed (countdown visible)
    [[nodiscard]] bool countdown_visible(TimePoint now) const noexcept;

    [[nodiscard]] std::int64_t elapsed_ms(TimePoint now) const noexcept;

    [[nodiscard]] LocalState local_state() const noexcept { return local_; }
    [[nodiscard]] RaceState race_state(TimePoint now) const noexcept;

    [[nodiscard]] bool forced_to_results() const noexcept { return forced_; }
    [[nodiscard]] const lcr::optional<TimePoint>& race_ended_at() const noexcept { return race_ended_at_; }
    [[nodiscard]] const lcr::optional<std::int64_t>& finish_time() const noexcept { return finish_time_; }

    void reset() noexcept;

private:
    LocalState local_{LocalState::Idle};
    TimePoint started_at_{};
    lcr::optional<TimePoint> race_ended_at_;
    lcr::optional<std::int64_t> finish_time_;
    bool forced_{false};
};

} // namespace wikirace::core::race
