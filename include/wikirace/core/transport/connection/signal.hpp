/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents edge-triggered facts emitted by
transport::Connection via poll_signal().

Connected
  The WebSocket upgrade completed. Emitted once per transport lifetime and
  increments the transport epoch.

Disconnected
  The logical connection became unusable, whatever the cause. Emitted once
  per transport lifetime that had reached Connecting. No retry follows.

Signals are informational. The authoritative value is Connection::state().
===============================================================================
*/
#pragma once

#include <cstdint>
#include <string_view>


namespace wikirace::core::transport::connection {

enum class Signal : uint8_t {
    None,
    Connected,
    Disconnected
};

[[nodiscard]]
inline constexpr std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:         return "None";
        case Signal::Connected:    return "Connected";
        case Signal::Disconnected: return "Disconnected";
        default:                   return "Unknown";
    }
}

} // namespace wikirace::core::transport::connection
