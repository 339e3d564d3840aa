#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <deque>
#include <cstdint>

#include "wikirace/core/transport/websocket_concept.hpp"
#include "wikirace/core/transport/parse_url.hpp"
#include "wikirace/core/transport/state.hpp"
#include "wikirace/core/transport/connection/signal.hpp"
#include "wikirace/core/transport/websocket/events.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace wikirace::core::transport {

/*
===============================================================================
 wikirace::core::transport::Connection
===============================================================================

Owns the lifecycle of one persistent bidirectional connection, parameterized
by a transport conforming to transport::WebSocketConcept.

The Connection performs no business logic. It knows nothing about rooms,
players or message types: it moves text frames and exposes its state.

-------------------------------------------------------------------------------
 State machine
-------------------------------------------------------------------------------

    Disconnected --open()--> Connecting --transport Connected--> Connected
         ^                       |                                   |
         |                       +--connect failed / Close-----------+
         +------------------- close() / transport Close -------------+

- open() while Connecting or Connected is a no-op. Only one transport
  instance can ever be alive per Connection.
- close() is idempotent and always leaves the Connection Disconnected.
- There is NO automatic reconnection. A dropped connection stays
  Disconnected until the owner calls open() again.

-------------------------------------------------------------------------------
 Sending
-------------------------------------------------------------------------------
send() transmits only while Connected and reports the outcome as a bool.
It never throws and never queues for later delivery.

-------------------------------------------------------------------------------
 Progress model
-------------------------------------------------------------------------------
- Everything happens inside poll(), on the caller's thread
- Inbound frames are drained with poll_message() in arrival order
- Frames already received before a remote Close are still drained
- transport epoch counts completed connections; rx/tx count frames
===============================================================================
*/

template <transport::WebSocketConcept WS>
class Connection {
public:
    Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Ensure transport is closed on destruction
    ~Connection() {
        close();
    }

    // Starts a connection attempt. Completion is observed through poll().
    [[nodiscard]]
    inline Error open(const std::string& url) noexcept {
        const auto state = get_state_();
        if (state == State::Connecting || state == State::Connected) {
            WR_DEBUG("[CONN] open() called while " << to_string(state) << " - skipping duplicate connection attempt.");
            return Error::None;
        }
        WR_DEBUG("[CONN] Connecting to: " << url);
        // 1) PRECONDITION: parse and validate URL
        ParsedUrl tmp;
        last_error_ = parse_url(url, tmp);
        if (last_error_ != Error::None) {
            WR_ERROR("[CONN] URL parsing failed for '" << url << "'");
            return last_error_;
        }
        if (tmp.secure) {
            WR_ERROR("[CONN] TLS endpoints (wss://) are not supported: '" << url << "'");
            last_error_ = Error::InvalidUrl;
            return last_error_;
        }
        last_url_ = url;
        parsed_url_ = std::move(tmp);
        // 2) Enter FSM
        transition_(Event::OpenRequested);
        // 3) Fresh transport per attempt
        create_transport_();
        // 4) Initiate
        last_error_ = ws_->connect(parsed_url_.value().host, parsed_url_.value().port, parsed_url_.value().path);
        if (last_error_ != Error::None) {
            WR_ERROR("[CONN] Connection attempt failed (" << to_string(last_error_) << ")");
            transition_(Event::TransportConnectFailed, last_error_);
            return last_error_;
        }
        return Error::None;
    }

    // Unconditional, idempotent shutdown
    inline void close() noexcept {
        if (get_state_() == State::Disconnected) {
            return;
        }
        transition_(Event::CloseRequested);
    }

    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        if (get_state_() != State::Connected) {
            WR_WARN("[CONN] send() called while not connected (state: " << to_string(get_state_()) << "). Ignoring.");
            return false;
        }
        if (ws_->send(text)) {
            ++tx_messages_;
            return true;
        }
        WR_WARN("[CONN] Transport refused outbound frame.");
        return false;
    }

    // Event loop step
    inline void poll() noexcept {
        if (!ws_) {
            return;
        }
        ws_->poll();
        websocket::Event ev;
        while (ws_ && ws_->poll_event(ev)) {
            switch (ev.type) {
                case websocket::EventType::Connected:
                    transition_(Event::TransportConnected);
                    break;
                case websocket::EventType::Error:
                    on_transport_error_(ev.error);
                    break;
                case websocket::EventType::Close:
                    on_transport_closed_();
                    break;
            }
        }
    }

    // Drains one inbound frame, if any
    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        if (!ws_) {
            return false;
        }
        if (ws_->poll_message(out)) {
            ++rx_messages_;
            return true;
        }
        return false;
    }

    [[nodiscard]]
    inline bool poll_signal(connection::Signal& out) noexcept {
        if (signals_.empty()) {
            return false;
        }
        out = signals_.front();
        signals_.pop_front();
        return true;
    }

    // Accessors
    [[nodiscard]] inline State state() const noexcept { return state_; }
    [[nodiscard]] inline bool is_connected() const noexcept { return state_ == State::Connected; }
    [[nodiscard]] inline std::uint64_t epoch() const noexcept { return epoch_; }
    [[nodiscard]] inline std::uint64_t rx_messages() const noexcept { return rx_messages_; }
    [[nodiscard]] inline std::uint64_t tx_messages() const noexcept { return tx_messages_; }
    [[nodiscard]] inline Error last_error() const noexcept { return last_error_; }
    [[nodiscard]] inline DisconnectReason disconnect_reason() const noexcept { return disconnect_reason_; }
    [[nodiscard]] inline const std::string& url() const noexcept { return last_url_; }

#ifdef WR_UNIT_TEST
public:
    WS& ws() {
        return *ws_;
    }

    bool has_transport() const noexcept {
        return static_cast<bool>(ws_);
    }
#endif // WR_UNIT_TEST

private:
    std::string last_url_;
    lcr::optional<ParsedUrl> parsed_url_;   // Invariant: has() while a transport exists
    std::unique_ptr<WS> ws_;                // Transport instance (owned)

    std::uint64_t epoch_{0};
    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};

    Error last_error_{Error::None};
    DisconnectReason disconnect_reason_{DisconnectReason::None};

    State state_{State::Disconnected};

    std::deque<connection::Signal> signals_;

private:
    inline State get_state_() const noexcept {
        return state_;
    }

    inline void set_state_(State new_state) noexcept {
        WR_TRACE("[CONN] State:  " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
    }

    inline void emit_(connection::Signal sig) noexcept {
        WR_TRACE("[CONN] Emitting signal: " << to_string(sig));
        signals_.push_back(sig);
    }

    inline void transition_(Event event, Error error = Error::None) noexcept {
        const State state = get_state_();

        WR_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        switch (state) {

        // ================================================================
        case State::Disconnected:
            switch (event) {
            case Event::OpenRequested:
                disconnect_reason_ = DisconnectReason::None;
                set_state_(State::Connecting);
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportConnected:
                set_state_(State::Connected);
                ++epoch_;
                emit_(connection::Signal::Connected);
                WR_INFO("[CONN] Connected to server: " << last_url_);
                break;

            case Event::TransportConnectFailed:
                last_error_ = error;
                disconnect_reason_ = DisconnectReason::ConnectFailed;
                set_state_(State::Disconnected);
                emit_(connection::Signal::Disconnected);
                break;

            case Event::TransportClosed:
                disconnect_reason_ = DisconnectReason::ConnectFailed;
                set_state_(State::Disconnected);
                emit_(connection::Signal::Disconnected);
                WR_WARN("[CONN] Connection attempt to " << last_url_ << " failed (" << to_string(last_error_) << ")");
                break;

            case Event::CloseRequested:
                disconnect_reason_ = DisconnectReason::LocalClose;
                ws_->close();
                set_state_(State::Disconnected);
                emit_(connection::Signal::Disconnected);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::CloseRequested:
                WR_DEBUG("[CONN] Disconnecting from: " << last_url_);
                disconnect_reason_ = DisconnectReason::LocalClose;
                ws_->close();
                set_state_(State::Disconnected);
                emit_(connection::Signal::Disconnected);
                WR_INFO("[CONN] Disconnected from server: " << last_url_);
                break;

            case Event::TransportClosed:
                if (disconnect_reason_ == DisconnectReason::None) {
                    disconnect_reason_ = DisconnectReason::RemoteClose;
                }
                set_state_(State::Disconnected);
                emit_(connection::Signal::Disconnected);
                WR_INFO("[CONN] Connection closed: " << last_url_ << " (reason: " << to_string(disconnect_reason_) << ")");
                break;

            default:
                break;
            }
            break;
        }
    }

    inline void create_transport_() {
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
        ws_ = std::make_unique<WS>();
    }

    inline void on_transport_error_(Error error) noexcept {
        if (disconnect_reason_ == DisconnectReason::LocalClose) {
            return;
        }
        WR_WARN("[CONN] Transport error: " << to_string(error));
        last_error_ = error;
        if (get_state_() == State::Connected) {
            disconnect_reason_ = (error == Error::RemoteClosed) ? DisconnectReason::RemoteClose : DisconnectReason::TransportError;
        }
    }

    inline void on_transport_closed_() noexcept {
        if (get_state_() == State::Disconnected) {
            return; // already resolved (local close)
        }
        transition_(Event::TransportClosed, last_error_);
    }
};

} // namespace wikirace::core::transport
