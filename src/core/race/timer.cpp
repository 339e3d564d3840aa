#include "wikirace/core/race/timer.hpp"

#include "wikirace/core/race/title.hpp"
#include "wikirace/core/config/race.hpp"
#include "lcr/log/logger.hpp"


namespace wikirace::core::race {

bool Timer::start(TimePoint now) noexcept {
    if (local_ != LocalState::Idle) {
        return false;
    }
    started_at_ = now;
    local_ = LocalState::Running;
    WR_DEBUG("[RACE] Local timer started");
    return true;
}

lcr::optional<std::int64_t> Timer::on_local_article(std::string_view article, std::string_view destination, TimePoint now) {
    if (local_ != LocalState::Running) {
        return {};
    }
    if (destination.empty() || !same_article(article, destination)) {
        return {};
    }
    local_ = LocalState::Finished;
    const std::int64_t elapsed = elapsed_ms(now);
    finish_time_ = elapsed;
    WR_INFO("[RACE] Destination '" << destination << "' reached in " << elapsed << " ms");
    on_finish_observed(now);
    return elapsed;
}

bool Timer::on_finish_observed(TimePoint now) noexcept {
    if (race_ended_at_.has()) {
        return false;
    }
    race_ended_at_ = now;
    WR_INFO("[RACE] First finish observed, grace period begins");
    return true;
}

bool Timer::poll(TimePoint now) noexcept {
    if (forced_ || local_ != LocalState::Running) {
        return false;
    }
    if (race_state(now) != RaceState::Closed) {
        return false;
    }
    forced_ = true;
    WR_INFO("[RACE] Grace period over, local player did not finish");
    return true;
}

std::int64_t Timer::countdown_remaining_ms(TimePoint now) const noexcept {
    const std::int64_t grace = config::race::GRACE_PERIOD.count();
    if (!race_ended_at_.has()) {
        return grace;
    }
    const TimePoint countdown_start = race_ended_at_.value() + config::race::FINISH_NOTIFICATION_DELAY;
    if (now <= countdown_start) {
        return grace;
    }
    const std::int64_t remaining = grace - to_millis(now - countdown_start);
    return (remaining > 0) ? remaining : 0;
}

std::int64_t Timer::countdown_seconds(TimePoint now) const noexcept {
    const std::int64_t ms = countdown_remaining_ms(now);
    return (ms + 999) / 1000;
}

bool Timer::countdown_visible(TimePoint now) const noexcept {
    return race_ended_at_.has() && now >= race_ended_at_.value() + config::race::FINISH_NOTIFICATION_DELAY;
}

std::int64_t Timer::elapsed_ms(TimePoint now) const noexcept {
    if (local_ == LocalState::Idle) {
        return 0;
    }
    if (local_ == LocalState::Finished && finish_time_.has()) {
        return finish_time_.value();
    }
    const std::int64_t ms = to_millis(now - started_at_);
    return (ms > 0) ? ms : 0;
}

RaceState Timer::race_state(TimePoint now) const noexcept {
    if (!race_ended_at_.has()) {
        return RaceState::InProgress;
    }
    return (countdown_remaining_ms(now) == 0) ? RaceState::Closed : RaceState::GracePeriod;
}

void Timer::reset() noexcept {
    local_ = LocalState::Idle;
    started_at_ = TimePoint{};
    race_ended_at_.reset();
    finish_time_.reset();
    forced_ = false;
}

} // namespace wikirace::core::race
