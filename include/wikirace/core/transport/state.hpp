#pragma once

#include <cstdint>
#include <string_view>


namespace wikirace::core::transport {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
enum class State : uint8_t {
    Disconnected,
    Connecting,
    Connected
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected: return "Disconnected";
        case State::Connecting:   return "Connecting";
        case State::Connected:    return "Connected";
        default:                  return "Unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    OpenRequested,
    CloseRequested,

    // --- Transport lifecycle ---
    TransportConnected,
    TransportConnectFailed,
    TransportClosed
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:          return "OpenRequested";
        case Event::CloseRequested:         return "CloseRequested";
        case Event::TransportConnected:     return "TransportConnected";
        case Event::TransportConnectFailed: return "TransportConnectFailed";
        case Event::TransportClosed:        return "TransportClosed";
        default:                            return "UnknownEvent";
    }
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : uint8_t {
    None,
    LocalClose,        // explicit close() by the owner
    RemoteClose,       // server closed the stream
    ConnectFailed,     // never reached Connected
    TransportError     // read / write failure
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:           return "None";
        case DisconnectReason::LocalClose:     return "LocalClose";
        case DisconnectReason::RemoteClose:    return "RemoteClose";
        case DisconnectReason::ConnectFailed:  return "ConnectFailed";
        case DisconnectReason::TransportError: return "TransportError";
        default:                               return "Unknown";
    }
}

} // namespace wikirace::core::transport
