#pragma once

/*
===============================================================================
 wikirace::core::transport::websocket::Event
===============================================================================

Control-plane event emitted by a WebSocket transport and drained by the owning
Connection through poll_event().

Transports never call back into the Connection. Completion handlers only
record facts; the Connection turns them into state transitions on its own
poll turn, so every transition happens on the thread that calls poll().

  • Connected → connect + upgrade handshake completed
  • Close     → stream is gone (local close, remote close or failure)
  • Error     → a failure was classified; a Close always follows it

Delivery is lossless and in order. Close is emitted exactly once per
transport lifetime.
===============================================================================
*/

#include <cstdint>
#include <type_traits>

#include "wikirace/core/transport/error.hpp"

namespace wikirace::core::transport::websocket {

enum class EventType : std::uint8_t {
    Connected = 0,
    Close     = 1,
    Error     = 2
};

struct Event {
    EventType type{EventType::Close};
    transport::Error error{transport::Error::None};  // meaningful for Error only

    static constexpr Event make_connected() noexcept {
        return Event{EventType::Connected, transport::Error::None};
    }

    static constexpr Event make_close() noexcept {
        return Event{EventType::Close, transport::Error::None};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");

} // namespace wikirace::core::transport::websocket
