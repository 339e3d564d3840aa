#pragma once

#include <string_view>
#include <concepts>

#include "simdjson.h"

#include "wikirace/core/protocol/message_type.hpp"
#include "wikirace/core/protocol/parser/result.hpp"
#include "wikirace/core/protocol/parser/helpers.hpp"
#include "wikirace/core/protocol/parser/adapters.hpp"
#include "wikirace/core/protocol/parser/room/room_state.hpp"
#include "wikirace/core/protocol/parser/room/player_joined.hpp"
#include "wikirace/core/protocol/parser/room/player_left.hpp"
#include "wikirace/core/protocol/parser/race/race_started.hpp"
#include "wikirace/core/protocol/parser/race/player_update.hpp"
#include "wikirace/core/protocol/parser/race/player_finish.hpp"
#include "wikirace/core/protocol/parser/cursor/cursor_update.hpp"
#include "wikirace/core/protocol/parser/system/error_notice.hpp"
#include "lcr/log/logger.hpp"


namespace wikirace::core {
namespace protocol {
namespace parser {

/*
================================================================================
Inbound Parsing Architecture
================================================================================

1) Router (this file)
   Parses the raw frame, reads the "type" discriminator, extracts "payload"
   and dispatches to the matching message parser. Unknown types, and
   client→server types echoed back, are Ignored: never fatal.

2) Message parsers (room/, race/, cursor/, system/)
   Validate one payload schema, log actionable diagnostics, fill a typed
   schema struct.

3) Adapters
   Domain-aware field parsing: identifiers, enums, race times, Player.

4) Helpers
   Strict, log-free JSON primitives.

The typed message is delivered to the Handler synchronously, before the
next frame is parsed, so the handler observes server order exactly.
================================================================================
*/

template<typename H>
concept MessageHandler =
    requires(H& h,
             const schema::RoomState& room,
             const schema::Player& player,
             const schema::PlayerLeft& left,
             const schema::RaceStarted& started,
             const schema::PlayerUpdate& update,
             const schema::PlayerFinish& finish,
             const schema::CursorUpdate& cursor,
             const schema::ErrorNotice& error)
{
    { h.on_room_state(room) };
    { h.on_player_joined(player) };
    { h.on_player_left(left) };
    { h.on_race_started(started) };
    { h.on_player_update(update) };
    { h.on_player_finish(finish) };
    { h.on_cursor_update(cursor) };
    { h.on_error_notice(error) };
};


template<MessageHandler Handler>
class Router {
public:
    explicit Router(Handler& handler)
        : handler_(handler)
    {
    }

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Main entry point. Parsing never throws; an exception thrown by the
    // handler propagates to the caller with the remaining frames untouched.
    [[nodiscard]]
    inline Result parse_and_route(std::string_view raw_msg) {
        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg.data(), raw_msg.size()).get(root);
        if (error) {
            WR_WARN("[PARSER] JSON parse error: " << simdjson::error_message(error) << " in message: " << raw_msg);
            return Result::InvalidJson;
        }

        MessageType type;
        auto r = adapter::parse_message_type_required(root, type);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'type' missing or invalid -> ignore message.");
            return r;
        }
        if (!is_server_message(type)) {
            WR_DEBUG("[PARSER] Ignoring message of type '" << to_string(type) << "'.");
            return Result::Ignored;
        }

        simdjson::dom::element payload;
        r = helper::parse_object_required(root, "payload", payload);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'payload' missing or invalid in '" << to_string(type) << "' message -> ignore message.");
            return r;
        }

        return route_(type, payload);
    }

private:
    Handler& handler_;

    // Underlying simdjson parser (buffers reused across frames)
    simdjson::dom::parser parser_;

private:
    template<typename Parser, typename Schema>
    [[nodiscard]]
    inline Result parse_(const simdjson::dom::element& payload, Schema& out) noexcept {
        return Parser::parse(payload, out);
    }

    [[nodiscard]]
    inline Result route_(MessageType type, const simdjson::dom::element& payload) {
        switch (type) {
            case MessageType::RoomState: {
                schema::RoomState msg;
                auto r = parse_<room::room_state>(payload, msg);
                if (r != Result::Parsed) return r;
                handler_.on_room_state(msg);
                return Result::Delivered;
            }
            case MessageType::PlayerJoined: {
                schema::Player msg;
                auto r = parse_<room::player_joined>(payload, msg);
                if (r != Result::Parsed) return r;
                handler_.on_player_joined(msg);
                return Result::Delivered;
            }
            case MessageType::PlayerLeft: {
                schema::PlayerLeft msg;
                auto r = parse_<room::player_left>(payload, msg);
                if (r != Result::Parsed) return r;
                handler_.on_player_left(msg);
                return Result::Delivered;
            }
            case MessageType::RaceStarted: {
                schema::RaceStarted msg;
                auto r = parse_<race::race_started>(payload, msg);
                if (r != Result::Parsed) return r;
                handler_.on_race_started(msg);
                return Result::Delivered;
            }
            case MessageType::PlayerUpdate: {
                schema::PlayerUpdate msg;
                auto r = parse_<race::player_update>(payload, msg);
                if (r != Result::Parsed) return r;
                handler_.on_player_update(msg);
                return Result::Delivered;
            }
            case MessageType::PlayerFinish: {
                schema::PlayerFinish msg;
                auto r = parse_<race::player_finish>(payload, msg);
                if (r != Result::Parsed) return r;
                handler_.on_player_finish(msg);
                return Result::Delivered;
            }
            case MessageType::CursorUpdate: {
                schema::CursorUpdate msg;
                auto r = parse_<cursor::cursor_update>(payload, msg);
                if (r != Result::Parsed) return r;
                handler_.on_cursor_update(msg);
                return Result::Delivered;
            }
            case MessageType::Error: {
                schema::ErrorNotice msg;
                auto r = parse_<system::error_notice>(payload, msg);
                if (r != Result::Parsed) return r;
                handler_.on_error_notice(msg);
                return Result::Delivered;
            }
            default:
                return Result::Ignored;
        }
    }
};

} // namespace parser
} // namespace protocol
} // namespace wikirace::core
