#include "wikirace/core/room/store.hpp"

#include "lcr/log/logger.hpp"


namespace wikirace::core::room {

void Store::apply(const RoomState& snapshot) {
    room_ = snapshot;
    has_room_ = true;
    ++version_;
    WR_DEBUG("[ROOM] Snapshot applied: " << room_);
}

void Store::apply(const Player& joined) {
    if (!has_room_) {
        WR_DEBUG("[ROOM] player_joined before room_state -> dropped (id=" << joined.id << ")");
        return;
    }
    // insert_or_assign: a duplicate id replaces the entry in place
    room_.players.insert_or_assign(joined.id, joined);
    ++version_;
    WR_DEBUG("[ROOM] Player joined: " << joined);
}

void Store::apply(const protocol::schema::PlayerLeft& msg) {
    if (!has_room_) {
        return;
    }
    if (room_.players.erase(msg.player_id) > 0) {
        ++version_;
        WR_DEBUG("[ROOM] Player left: " << msg.player_id);
    }
}

void Store::apply(const protocol::schema::RaceStarted& msg) {
    if (!has_room_) {
        WR_DEBUG("[ROOM] race_started before room_state -> dropped");
        return;
    }
    room_.started = true;
    if (!msg.start_article.empty()) {
        room_.start_article = msg.start_article;
    }
    if (!msg.end_article.empty()) {
        room_.end_article = msg.end_article;
    }
    ++version_;
    WR_DEBUG("[ROOM] Race started: " << room_.start_article << " -> " << room_.end_article);
}

void Store::apply(const protocol::schema::PlayerUpdate& msg) {
    Player* p = find_mut_(msg.player_id);
    if (!p) {
        WR_DEBUG("[ROOM] player_update for unknown id '" << msg.player_id << "' -> dropped");
        return;
    }
    p->current_article = msg.current_article;
    p->clicks = msg.clicks;
    ++version_;
}

void Store::apply(const protocol::schema::PlayerFinish& msg) {
    Player* p = find_mut_(msg.player_id);
    if (!p) {
        WR_DEBUG("[ROOM] player_finish for unknown id '" << msg.player_id << "' -> dropped");
        return;
    }
    p->finished = true;
    // finishTime is final once set
    if (!p->finish_time.has()) {
        p->finish_time = msg.time;
    }
    p->clicks = msg.clicks;
    if (!msg.path.empty()) {
        p->path = msg.path;
    }
    ++version_;
    WR_DEBUG("[ROOM] Player finished: " << *p);
}

void Store::apply(const protocol::schema::ErrorNotice& msg) {
    last_error_ = msg.error;
    WR_WARN("[ROOM] Server error: " << msg.error);
}

void Store::clear() {
    room_ = RoomState{};
    has_room_ = false;
    last_error_.clear();
    ++version_;
}

const Store::Player* Store::find(std::string_view player_id) const {
    if (!has_room_) {
        return nullptr;
    }
    auto it = room_.players.find(std::string(player_id));
    return (it == room_.players.end()) ? nullptr : &it->second;
}

const Store::Player* Store::find_by_name(std::string_view name) const {
    if (!has_room_) {
        return nullptr;
    }
    for (const auto& [id, player] : room_.players) {
        if (player.name == name) {
            return &player;
        }
    }
    return nullptr;
}

Store::Player* Store::find_mut_(std::string_view player_id) {
    if (!has_room_) {
        return nullptr;
    }
    auto it = room_.players.find(std::string(player_id));
    return (it == room_.players.end()) ? nullptr : &it->second;
}

} // namespace wikirace::core::room
