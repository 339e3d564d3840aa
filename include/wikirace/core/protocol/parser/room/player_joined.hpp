#pragma once

#include "wikirace/core/protocol/schema/player.hpp"
#include "wikirace/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace wikirace::core::protocol::parser::room {

// The payload is a whole Player object
struct player_joined {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& payload, schema::Player& out) noexcept {
        out = schema::Player{};
        auto r = adapter::parse_player(payload, out);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Invalid player in player_joined (" << to_string(r) << ") -> ignore message.");
        }
        return r;
    }
};

} // namespace wikirace::core::protocol::parser::room
