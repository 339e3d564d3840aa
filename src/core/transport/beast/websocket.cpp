#include "wikirace/core/transport/beast/websocket.hpp"

#include <deque>
#include <chrono>
#include <exception>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "lcr/log/logger.hpp"


namespace wikirace::core::transport::beast {

namespace asio = boost::asio;
namespace bst  = boost::beast;
namespace ws   = boost::beast::websocket;
using tcp      = boost::asio::ip::tcp;

namespace {

constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(10);

// Maps a Beast / Asio error onto the transport taxonomy
Error classify_(const bst::error_code& ec, Error fallback) noexcept {
    if (ec == ws::error::closed || ec == asio::error::eof || ec == asio::error::connection_reset) {
        return Error::RemoteClosed;
    }
    if (ec == bst::error::timeout || ec == asio::error::timed_out) {
        return Error::Timeout;
    }
    if (ec == asio::error::operation_aborted) {
        return Error::Cancelled;
    }
    return fallback;
}

} // namespace


struct WebSocket::Impl {
    // Declared first: destroyed last, after every I/O object that refers to it
    asio::io_context ioc;
    tcp::resolver resolver{ioc};
    ws::stream<bst::tcp_stream> stream{ioc};
    bst::flat_buffer buffer;

    std::string host;
    std::string path;

    std::deque<std::string> outbox;
    std::deque<websocket::Event> events;
    std::deque<std::string> inbox;

    bool open{false};       // upgrade completed, not closed
    bool writing{false};    // one async_write in flight
    bool closing{false};    // local close requested
    bool finished{false};   // Close event emitted

    void start(const std::string& h, const std::string& port, const std::string& p) {
        host = h + ":" + port;
        path = p;
        resolver.async_resolve(h, port,
            [this](const bst::error_code& ec, tcp::resolver::results_type results) {
                on_resolve_(ec, std::move(results));
            });
    }

    void on_resolve_(const bst::error_code& ec, tcp::resolver::results_type results) {
        if (ec) {
            WR_WARN("[WS] Resolve failed for " << host << ": " << ec.message());
            fail_(classify_(ec, Error::ConnectionFailed));
            return;
        }
        bst::get_lowest_layer(stream).expires_after(CONNECT_TIMEOUT);
        bst::get_lowest_layer(stream).async_connect(results,
            [this](const bst::error_code& ec, const tcp::endpoint&) {
                on_connect_(ec);
            });
    }

    void on_connect_(const bst::error_code& ec) {
        if (ec) {
            WR_WARN("[WS] TCP connect failed for " << host << ": " << ec.message());
            fail_(classify_(ec, Error::ConnectionFailed));
            return;
        }
        // The websocket stream manages its own timeouts from here on
        bst::get_lowest_layer(stream).expires_never();
        stream.set_option(ws::stream_base::timeout::suggested(bst::role_type::client));
        stream.async_handshake(host, path,
            [this](const bst::error_code& ec) {
                on_handshake_(ec);
            });
    }

    void on_handshake_(const bst::error_code& ec) {
        if (ec) {
            WR_WARN("[WS] Upgrade handshake failed for " << host << path << ": " << ec.message());
            fail_(classify_(ec, Error::HandshakeFailed));
            return;
        }
        WR_DEBUG("[WS] Handshake complete: " << host << path);
        stream.text(true);
        open = true;
        events.push_back(websocket::Event::make_connected());
        if (closing) {
            start_close_();
            return;
        }
        do_read_();
    }

    void do_read_() {
        stream.async_read(buffer,
            [this](const bst::error_code& ec, std::size_t) {
                on_read_(ec);
            });
    }

    void on_read_(const bst::error_code& ec) {
        if (ec) {
            if (closing && (ec == asio::error::operation_aborted || ec == ws::error::closed)) {
                finish_();
                return;
            }
            const Error e = classify_(ec, Error::TransportFailure);
            if (e != Error::RemoteClosed) {
                WR_WARN("[WS] Read failed: " << ec.message());
            }
            fail_(e);
            return;
        }
        inbox.push_back(bst::buffers_to_string(buffer.data()));
        buffer.consume(buffer.size());
        do_read_();
    }

    bool send(std::string_view msg) {
        if (!open || closing) {
            return false;
        }
        outbox.emplace_back(msg);
        if (!writing) {
            do_write_();
        }
        return true;
    }

    void do_write_() {
        writing = true;
        stream.async_write(asio::buffer(outbox.front()),
            [this](const bst::error_code& ec, std::size_t) {
                on_write_(ec);
            });
    }

    void on_write_(const bst::error_code& ec) {
        writing = false;
        if (ec) {
            WR_WARN("[WS] Write failed: " << ec.message());
            fail_(classify_(ec, Error::TransportFailure));
            return;
        }
        outbox.pop_front();
        if (!outbox.empty()) {
            do_write_();
        } else if (closing) {
            start_close_();
        }
    }

    void close() {
        if (finished || closing) {
            return;
        }
        closing = true;
        if (!open) {
            // Still establishing: abort whatever step is pending
            resolver.cancel();
            bst::error_code ignored;
            bst::get_lowest_layer(stream).socket().close(ignored);
            finish_();
            return;
        }
        if (!writing) {
            start_close_();
        }
    }

    void start_close_() {
        stream.async_close(ws::close_code::normal,
            [this](const bst::error_code& ec) {
                if (ec && ec != asio::error::operation_aborted) {
                    WR_DEBUG("[WS] Close handshake ended with: " << ec.message());
                }
                finish_();
            });
    }

    void fail_(Error e) {
        if (finished) {
            return;
        }
        if (!closing) {
            events.push_back(websocket::Event::make_error(e));
        }
        bst::error_code ignored;
        bst::get_lowest_layer(stream).socket().close(ignored);
        finish_();
    }

    void finish_() {
        if (finished) {
            return;
        }
        finished = true;
        open = false;
        events.push_back(websocket::Event::make_close());
    }
};


WebSocket::WebSocket()
    : impl_(std::make_unique<Impl>())
{
}

WebSocket::~WebSocket() = default;

Error WebSocket::connect(const std::string& host, const std::string& port, const std::string& path) noexcept {
    if (impl_->open || impl_->finished || impl_->closing) {
        return Error::InvalidState;
    }
    try {
        impl_->start(host, port, path);
    } catch (const std::exception& e) {
        WR_ERROR("[WS] Unable to start connection to " << host << ":" << port << " (" << e.what() << ")");
        return Error::ConnectionFailed;
    }
    return Error::None;
}

void WebSocket::close() noexcept {
    try {
        impl_->close();
    } catch (const std::exception& e) {
        WR_ERROR("[WS] close() failed: " << e.what());
        impl_->finish_();
    }
}

bool WebSocket::send(std::string_view msg) noexcept {
    try {
        return impl_->send(msg);
    } catch (const std::exception& e) {
        WR_ERROR("[WS] send() failed: " << e.what());
        return false;
    }
}

void WebSocket::poll() noexcept {
    try {
        if (impl_->ioc.stopped()) {
            impl_->ioc.restart();
        }
        impl_->ioc.poll();
    } catch (const std::exception& e) {
        WR_ERROR("[WS] Completion handler failed: " << e.what());
        impl_->fail_(Error::TransportFailure);
    }
}

bool WebSocket::poll_event(websocket::Event& out) noexcept {
    if (impl_->events.empty()) {
        return false;
    }
    out = impl_->events.front();
    impl_->events.pop_front();
    return true;
}

bool WebSocket::poll_message(std::string& out) noexcept {
    if (impl_->inbox.empty()) {
        return false;
    }
    out = std::move(impl_->inbox.front());
    impl_->inbox.pop_front();
    return true;
}

} // namespace wikirace::core::transport::beast
