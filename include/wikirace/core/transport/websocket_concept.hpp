/*
===============================================================================
WebSocketConcept (Poll-Driven)
===============================================================================

Defines the minimal transport contract required by Connection.

The WebSocket implementation:

  • Initiates connection establishment in connect() and returns immediately
  • Never blocks the calling thread
  • Makes progress only inside poll()
  • Queues control-plane events (Connected / Close / Error)
  • Queues complete inbound text frames, one std::string per frame
  • Is fully lifecycle-managed by Connection (one instance per connect())

No callbacks into the owner. No background threads.
===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "wikirace/core/transport/error.hpp"
#include "wikirace/core/transport/websocket/events.hpp"


namespace wikirace::core::transport {

template<class WS>
concept WebSocketConcept =
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        std::string_view msg,
        websocket::Event& ev,
        std::string& frame
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------
    { ws.connect(host, port, path) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------
    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Progress and draining
    // ---------------------------------------------------------------------
    { ws.poll() } noexcept -> std::same_as<void>;
    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
    { ws.poll_message(frame) } noexcept -> std::same_as<bool>;
};

} // namespace wikirace::core::transport
