#include "wikirace/core/notify/notifier.hpp"

#include "wikirace/core/config/race.hpp"
#include "lcr/log/logger.hpp"


namespace wikirace::core::notify {

std::ostream& operator<<(std::ostream& os, const Notification& n) {
    return os << "[Notification] {kind=" << to_string(n.kind)
              << ", player=" << n.player_id
              << ", text=\"" << n.text << "\"}";
}

std::vector<Notification> MeetingNotifier::on_room_changed(const protocol::schema::RoomState& room,
                                                           std::string_view local_id,
                                                           std::string_view local_article,
                                                           TimePoint now)
{
    std::vector<Notification> raised;
    on_same_page_.clear();
    if (local_article.empty()) {
        return raised;
    }

    for (const auto& [id, p] : room.players) {
        if (id == local_id || p.current_article != local_article) {
            continue;
        }
        on_same_page_.insert(id);

        // Everybody begins on the start article
        if (p.current_article == room.start_article) {
            continue;
        }
        auto& articles = met_[id];
        if (articles.count(local_article) > 0) {
            continue;
        }
        articles.emplace(local_article);

        Notification n;
        n.kind = Kind::SamePage;
        n.player_id = id;
        n.player_name = p.name;
        n.article = std::string(local_article);
        n.text = p.name + " is on the same page";
        n.color = player_color(p.name);
        raised.push_back(show_(std::move(n), now));
    }
    return raised;
}

const Notification& MeetingNotifier::on_player_finished(std::string_view player_id, std::string_view player_name, TimePoint now) {
    Notification n;
    n.kind = Kind::Finished;
    n.player_id = std::string(player_id);
    n.player_name = std::string(player_name);
    n.text = n.player_name + " reached the target article!";
    n.color = player_color(player_name);
    return show_(std::move(n), now);
}

bool MeetingNotifier::poll(TimePoint now) noexcept {
    if (current_.has() && now >= current_.value().expires_at) {
        WR_TRACE("[NOTIFY] Dismissed: " << current_.value());
        current_.reset();
        return true;
    }
    return false;
}

bool MeetingNotifier::has_met(std::string_view player_id, std::string_view article) const {
    auto it = met_.find(player_id);
    return it != met_.end() && it->second.count(article) > 0;
}

void MeetingNotifier::reset() noexcept {
    met_.clear();
    on_same_page_.clear();
    current_.reset();
}

const Notification& MeetingNotifier::show_(Notification n, TimePoint now) {
    n.shown_at = now;
    n.expires_at = now + config::race::NOTIFICATION_DURATION;
    ++raised_;
    WR_INFO("[NOTIFY] " << n.text);
    current_ = std::move(n);
    return current_.value();
}

} // namespace wikirace::core::notify
