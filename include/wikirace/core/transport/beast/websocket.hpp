#pragma once

#include <string>
#include <string_view>
#include <memory>

#include "wikirace/core/transport/error.hpp"
#include "wikirace/core/transport/websocket/events.hpp"
#include "wikirace/core/transport/websocket_concept.hpp"


namespace wikirace::core::transport::beast {

/*
===============================================================================
 transport::beast::WebSocket
===============================================================================

Boost.Beast implementation of transport::WebSocketConcept for plain ws://
endpoints.

Each instance owns a private io_context that is advanced only by poll().
No thread is spawned and no call blocks:

    connect()  → async resolve → async connect → async upgrade handshake
    poll()     → runs every ready completion handler, then returns
    send()     → appends to the outbound chain (one async_write in flight)
    close()    → graceful close frame once pending writes are flushed

Completion handlers only record facts into the event and message queues.
The owning Connection drains them on its own poll turn.

An instance is single-use: after Close it must be discarded.
===============================================================================
*/
class WebSocket {
public:
    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]] Error connect(const std::string& host, const std::string& port, const std::string& path) noexcept;
    void close() noexcept;

    [[nodiscard]] bool send(std::string_view msg) noexcept;

    void poll() noexcept;
    [[nodiscard]] bool poll_event(websocket::Event& out) noexcept;
    [[nodiscard]] bool poll_message(std::string& out) noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace wikirace::core::transport::beast
