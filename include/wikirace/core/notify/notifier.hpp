#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include <ostream>

#include "wikirace/core/clock.hpp"
#include "wikirace/core/notify/color.hpp"
#include "wikirace/core/protocol/schema/room_state.hpp"
#include "lcr/optional.hpp"


namespace wikirace::core::notify {

enum class Kind {
    SamePage,   // "<name> is on the same page"
    Finished    // "<name> reached the target article!"
};

[[nodiscard]]
inline constexpr std::string_view to_string(Kind k) noexcept {
    switch (k) {
        case Kind::SamePage: return "SamePage";
        case Kind::Finished: return "Finished";
    }
    return "Unknown";
}

struct Notification {
    Kind kind{Kind::SamePage};
    std::string player_id;
    std::string player_name;
    std::string article;        // empty for Finished
    std::string text;
    Rgb color;
    TimePoint shown_at{};
    TimePoint expires_at{};
};

std::ostream& operator<<(std::ostream& os, const Notification& n);

/*
===============================================================================
 notify::MeetingNotifier
===============================================================================
Meeting record: per remote player id, the articles at which a same-page
notification was already shown. It only grows during a race and is cleared
by reset(); leaving an article and coming back never re-announces.

Finishes bypass the record: every remote finish is announced.

One notification is visible at a time. A newer one replaces it; each one
expires NOTIFICATION_DURATION after it was shown, whatever happens next.
===============================================================================
*/
class MeetingNotifier {
public:
    MeetingNotifier() = default;

    // Re-evaluates co-location after any room change (or local navigation).
    // Returns the notifications raised by this call, oldest first.
    std::vector<Notification> on_room_changed(const protocol::schema::RoomState& room,
                                              std::string_view local_id,
                                              std::string_view local_article,
                                              TimePoint now);

    const Notification& on_player_finished(std::string_view player_id, std::string_view player_name, TimePoint now);

    // Drops expired notifications; true if the visible one just expired
    bool poll(TimePoint now) noexcept;

    [[nodiscard]] const lcr::optional<Notification>& current() const noexcept { return current_; }

    [[nodiscard]] bool has_met(std::string_view player_id, std::string_view article) const;

    // Remote players currently on the local article
    [[nodiscard]] const std::set<std::string, std::less<>>& on_same_page() const noexcept { return on_same_page_; }

    [[nodiscard]] std::size_t raised() const noexcept { return raised_; }

    // New race: forget every meeting
    void reset() noexcept;

private:
    std::map<std::string, std::set<std::string, std::less<>>, std::less<>> met_;
    std::set<std::string, std::less<>> on_same_page_;
    lcr::optional<Notification> current_;
    std::size_t raised_{0};

private:
    const Notification& show_(Notification n, TimePoint now);
};

} // namespace wikirace::core::notify
