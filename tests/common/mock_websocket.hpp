#pragma once

#include <deque>
#include <string>
#include <string_view>
#include <vector>

#include "wikirace/core/transport/websocket_concept.hpp"
#include "wikirace/core/transport/websocket/events.hpp"
#include "wikirace/core/transport/error.hpp"
#include "lcr/log/logger.hpp"


namespace wikirace::core::transport::test {

// -----------------------------------------------------------------------------
// Scriptable in-memory transport.
//
// Per-instance queues hold what the "server" pushes; static counters track
// what the Connection did to every instance it created. By default connect()
// succeeds and queues a Connected event for the next poll().
// -----------------------------------------------------------------------------
class MockWebSocket {
public:
    MockWebSocket() noexcept {
        ++construct_count_;
        WR_DEBUG("[MockWebSocket] constructed");
    }

    ~MockWebSocket() {
        WR_DEBUG("[MockWebSocket] destructed");
    }

    MockWebSocket(const MockWebSocket&) = delete;
    MockWebSocket& operator=(const MockWebSocket&) = delete;

    // ---------------------------------------------------------------------
    // transport::WebSocketConcept API
    // ---------------------------------------------------------------------

    inline Error connect(const std::string& host, const std::string& port, const std::string& path) noexcept {
        WR_DEBUG("[MockWebSocket] connect(" << host << ":" << port << path << ")");
        ++connect_count_;
        host_ = host;
        port_ = port;
        path_ = path;
        if (fail_connect_) {
            return Error::ConnectionFailed;
        }
        if (auto_connect_) {
            events_.push_back(websocket::Event::make_connected());
            open_ = true;
        }
        return Error::None;
    }

    inline void close() noexcept {
        if (closed_) {
            return;
        }
        WR_DEBUG("[MockWebSocket] close() called");
        closed_ = true;
        open_ = false;
        ++close_count_;
        events_.push_back(websocket::Event::make_close());
    }

    inline bool send(std::string_view text) noexcept {
        if (!open_ || refuse_send_) {
            return false;
        }
        sent_.emplace_back(text);
        ++send_count_;
        return true;
    }

    inline void poll() noexcept {
        ++poll_count_;
    }

    inline bool poll_event(websocket::Event& ev) noexcept {
        if (events_.empty()) {
            return false;
        }
        ev = events_.front();
        events_.pop_front();
        return true;
    }

    inline bool poll_message(std::string& out) noexcept {
        if (messages_.empty()) {
            return false;
        }
        out = std::move(messages_.front());
        messages_.pop_front();
        return true;
    }

    // ---------------------------------------------------------------------
    // Test helpers (server side)
    // ---------------------------------------------------------------------

    inline void emit_connected() {
        open_ = true;
        events_.push_back(websocket::Event::make_connected());
    }

    inline void emit_message(std::string_view frame) {
        messages_.emplace_back(frame);
    }

    // Remote close: the stream is gone, a Close event follows
    inline void emit_close() {
        if (closed_) {
            return;
        }
        closed_ = true;
        open_ = false;
        events_.push_back(websocket::Event::make_close());
    }

    inline void emit_error(Error err) {
        ++error_count_;
        events_.push_back(websocket::Event::make_error(err));
    }

    // Accessors
    [[nodiscard]] inline const std::vector<std::string>& sent() const noexcept { return sent_; }
    [[nodiscard]] inline bool is_open() const noexcept { return open_; }
    [[nodiscard]] inline const std::string& host() const noexcept { return host_; }
    [[nodiscard]] inline const std::string& port() const noexcept { return port_; }
    [[nodiscard]] inline const std::string& path() const noexcept { return path_; }
    [[nodiscard]] inline int poll_count() const noexcept { return poll_count_; }

    inline void clear_sent() noexcept { sent_.clear(); }
    inline void refuse_send(bool on) noexcept { refuse_send_ = on; }

    [[nodiscard]] static inline int construct_count() noexcept { return construct_count_; }
    [[nodiscard]] static inline int connect_count() noexcept { return connect_count_; }
    [[nodiscard]] static inline int close_count() noexcept { return close_count_; }
    [[nodiscard]] static inline int send_count() noexcept { return send_count_; }
    [[nodiscard]] static inline int error_count() noexcept { return error_count_; }

    // mutators
    static inline void fail_connect(bool on) noexcept { fail_connect_ = on; }
    static inline void auto_connect(bool on) noexcept { auto_connect_ = on; }

    static inline void reset() noexcept {
        construct_count_ = 0;
        connect_count_ = 0;
        close_count_ = 0;
        send_count_ = 0;
        error_count_ = 0;
        fail_connect_ = false;
        auto_connect_ = true;
    }

private:
    std::deque<websocket::Event> events_;
    std::deque<std::string> messages_;
    std::vector<std::string> sent_;
    std::string host_;
    std::string port_;
    std::string path_;
    bool open_{false};
    bool closed_{false};
    bool refuse_send_{false};
    int poll_count_{0};

    static inline int construct_count_ = 0;
    static inline int connect_count_ = 0;
    static inline int close_count_ = 0;
    static inline int send_count_ = 0;
    static inline int error_count_ = 0;
    static inline bool fail_connect_ = false;
    static inline bool auto_connect_ = true;
};

// Assert that MockWebSocket conforms to transport::WebSocketConcept concept
static_assert(WebSocketConcept<MockWebSocket>);

} // namespace wikirace::core::transport::test
