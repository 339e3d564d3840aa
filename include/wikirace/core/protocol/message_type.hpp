#pragma once

#include <cstdint>
#include <string_view>


namespace wikirace::core::protocol {

// ===============================================================
// MESSAGE TYPE ENUM
// ===============================================================
// Every frame is {"type": <MessageType>, "payload": {...}}.
enum class MessageType : uint8_t {
    // --- client → server ---
    JoinRoom,
    RejoinRoom,
    LeaveRoom,
    StartRace,
    Navigate,
    Finish,
    Cursor,
    UpdateRoom,

    // --- server → client ---
    RoomState,
    PlayerJoined,
    PlayerLeft,
    RaceStarted,
    PlayerUpdate,
    PlayerFinish,
    CursorUpdate,
    Error,

    Unknown
};

[[nodiscard]]
inline constexpr std::string_view to_string(MessageType t) noexcept {
    switch (t) {
        case MessageType::JoinRoom:     return "join_room";
        case MessageType::RejoinRoom:   return "rejoin_room";
        case MessageType::LeaveRoom:    return "leave_room";
        case MessageType::StartRace:    return "start_race";
        case MessageType::Navigate:     return "navigate";
        case MessageType::Finish:       return "finish";
        case MessageType::Cursor:       return "cursor";
        case MessageType::UpdateRoom:   return "update_room";
        case MessageType::RoomState:    return "room_state";
        case MessageType::PlayerJoined: return "player_joined";
        case MessageType::PlayerLeft:   return "player_left";
        case MessageType::RaceStarted:  return "race_started";
        case MessageType::PlayerUpdate: return "player_update";
        case MessageType::PlayerFinish: return "player_finish";
        case MessageType::CursorUpdate: return "cursor_update";
        case MessageType::Error:        return "error";
        default:                        return "unknown";
    }
}

[[nodiscard]]
inline constexpr MessageType to_message_type(std::string_view s) noexcept {
    constexpr MessageType all[] = {
        MessageType::JoinRoom, MessageType::RejoinRoom, MessageType::LeaveRoom,
        MessageType::StartRace, MessageType::Navigate, MessageType::Finish,
        MessageType::Cursor, MessageType::UpdateRoom, MessageType::RoomState,
        MessageType::PlayerJoined, MessageType::PlayerLeft, MessageType::RaceStarted,
        MessageType::PlayerUpdate, MessageType::PlayerFinish, MessageType::CursorUpdate,
        MessageType::Error
    };
    for (MessageType t : all) {
        if (to_string(t) == s) {
            return t;
        }
    }
    return MessageType::Unknown;
}

// True for types the server emits; anything else arriving at a client is ignored
[[nodiscard]]
inline constexpr bool is_server_message(MessageType t) noexcept {
    switch (t) {
        case MessageType::RoomState:
        case MessageType::PlayerJoined:
        case MessageType::PlayerLeft:
        case MessageType::RaceStarted:
        case MessageType::PlayerUpdate:
        case MessageType::PlayerFinish:
        case MessageType::CursorUpdate:
        case MessageType::Error:
            return true;
        default:
            return false;
    }
}

} // namespace wikirace::core::protocol
