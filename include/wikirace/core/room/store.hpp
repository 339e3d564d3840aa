#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "wikirace/core/protocol/schema/room_state.hpp"
#include "wikirace/core/protocol/schema/server.hpp"


namespace wikirace::core::room {

/*
===============================================================================
 wikirace::core::room::Store
===============================================================================

Client-side mirror of the server's Room, reduced from inbound messages:

    room_state      full replace
    player_joined   upsert by id (a repeated id replaces in place)
    player_left     remove by id
    race_started    started = true
    player_update   patch currentArticle + clicks of one id (path untouched)
    player_finish   finished = true, finishTime set once; idempotent
    error           last_error() only, the Room is left as is

Identity is always the player id. Display names are never used as keys
because several players may share one.

Incremental messages that arrive before any room_state have nothing to
patch and are dropped. Every mutation bumps version(), which consumers use
to detect "room state changed".
===============================================================================
*/
class Store {
public:
    using Player = protocol::schema::Player;
    using RoomState = protocol::schema::RoomState;

    Store() = default;

    // Reducers
    void apply(const RoomState& snapshot);
    void apply(const Player& joined);
    void apply(const protocol::schema::PlayerLeft& msg);
    void apply(const protocol::schema::RaceStarted& msg);
    void apply(const protocol::schema::PlayerUpdate& msg);
    void apply(const protocol::schema::PlayerFinish& msg);
    void apply(const protocol::schema::ErrorNotice& msg);

    // Forget the room entirely (leave / teardown)
    void clear();

    [[nodiscard]] bool has_room() const noexcept { return has_room_; }
    [[nodiscard]] const RoomState& room() const noexcept { return room_; }
    [[nodiscard]] bool started() const noexcept { return has_room_ && room_.started; }
    [[nodiscard]] const std::string& host_id() const noexcept { return room_.host_id; }

    // nullptr when the id is unknown
    [[nodiscard]] const Player* find(std::string_view player_id) const;

    // First player whose display name matches, nullptr if none
    [[nodiscard]] const Player* find_by_name(std::string_view name) const;

    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    void clear_error() noexcept { last_error_.clear(); }

    [[nodiscard]] std::uint64_t version() const noexcept { return version_; }

private:
    RoomState room_;
    bool has_room_{false};
    std::string last_error_;
    std::uint64_t version_{0};

private:
    Player* find_mut_(std::string_view player_id);
};

} // namespace wikirace::core::room
