#pragma once

#include "wikirace/core/protocol/schema/server.hpp"
#include "wikirace/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace wikirace::core::protocol::parser::room {

struct player_left {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& payload, schema::PlayerLeft& out) noexcept {
        auto r = adapter::parse_id_required(payload, "playerId", out.player_id);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'playerId' missing or invalid in player_left -> ignore message.");
        }
        return r;
    }
};

} // namespace wikirace::core::protocol::parser::room
