#pragma once

#include "wikirace/core/protocol/schema/room_state.hpp"
#include "wikirace/core/protocol/parser/helpers.hpp"
#include "wikirace/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace wikirace::core::protocol::parser::room {

struct room_state {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& payload, schema::RoomState& out) noexcept {
        out = schema::RoomState{};

        auto r = helper::require_object(payload);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Payload not an object in room_state -> ignore message.");
            return r;
        }

        // id (required)
        r = adapter::parse_id_required(payload, "id", out.id);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'id' missing or invalid in room_state -> ignore message.");
            return r;
        }

        // players (required object keyed by player id)
        simdjson::dom::element players;
        r = helper::parse_object_required(payload, "players", players);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'players' missing or invalid in room_state -> ignore message.");
            return r;
        }
        simdjson::dom::object players_obj;
        if (players.get(players_obj)) {
            return Result::InvalidSchema;
        }
        for (auto field : players_obj) {
            schema::Player player;
            r = adapter::parse_player(field.value, player);
            if (r != Result::Parsed) {
                WR_DEBUG("[PARSER] Player '" << field.key << "' invalid in room_state -> ignore message.");
                return r;
            }
            if (player.id != field.key) {
                WR_DEBUG("[PARSER] Player key '" << field.key << "' does not match id '" << player.id << "' in room_state -> ignore message.");
                return Result::InvalidValue;
            }
            out.players.emplace(player.id, std::move(player));
        }

        // startArticle / endArticle (required)
        r = adapter::parse_text_required(payload, "startArticle", out.start_article);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'startArticle' missing or invalid in room_state -> ignore message.");
            return r;
        }
        r = adapter::parse_text_required(payload, "endArticle", out.end_article);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'endArticle' missing or invalid in room_state -> ignore message.");
            return r;
        }

        // started (required)
        r = helper::parse_bool_required(payload, "started", out.started);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'started' missing or invalid in room_state -> ignore message.");
            return r;
        }

        // hostId (optional)
        r = adapter::parse_text_optional(payload, "hostId", out.host_id);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'hostId' invalid in room_state -> ignore message.");
            return r;
        }

        return Result::Parsed;
    }
};

} // namespace wikirace::core::protocol::parser::room
