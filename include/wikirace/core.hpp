#pragma once

/*
================================================================================
wikirace core: primary entry point
================================================================================

    wikirace::core::Client = Session<transport::beast::WebSocket>

A race session bound to the Boost.Beast transport.

-------------------------------------------------------------------------------
Execution model
-------------------------------------------------------------------------------
Single-threaded and poll-driven. The application thread calls

    client.poll(now);

from its main loop (typically once per frame). Inside that call, and only
there, the transport's io_context runs ready completion handlers, inbound
frames are parsed and applied to the room in arrival order, the countdown
is evaluated and notifications expire. User-originated events (navigate,
pointer_move, scroll_tick, join/leave) are separate, non-preemptible turns
on the same thread.

There is no global mutable state besides the logger and the icon cache.
There are no background threads.
If progress occurs, it is because poll() or an event entry point was called.

-------------------------------------------------------------------------------
Reconnection
-------------------------------------------------------------------------------
None is automatic. After a drop the owner calls connect() again; when a
rejoin was armed with rejoin_room(), the session re-sends it exactly once
on the new connection.
================================================================================
*/

#include "wikirace/core/transport/websocket_concept.hpp"
#include "wikirace/core/transport/beast/websocket.hpp"
#include "wikirace/core/transport/connection.hpp"
#include "wikirace/core/session.hpp"


namespace wikirace::core {

namespace transport {

    using WebSocketT  = beast::WebSocket;
    using ConnectionT = Connection<WebSocketT>;

} // namespace transport

using Client = Session<transport::WebSocketT>;

} // namespace wikirace::core
