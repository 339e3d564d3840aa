#pragma once

#include "wikirace/core/protocol/schema/server.hpp"
#include "wikirace/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace wikirace::core::protocol::parser::race {

struct player_finish {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& payload, schema::PlayerFinish& out) noexcept {
        auto r = adapter::parse_id_required(payload, "playerId", out.player_id);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'playerId' missing or invalid in player_finish -> ignore message.");
            return r;
        }
        r = adapter::parse_text_optional(payload, "playerName", out.player_name);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'playerName' invalid in player_finish -> ignore message.");
            return r;
        }
        r = adapter::parse_race_time_required(payload, "time", out.time);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'time' missing or invalid in player_finish -> ignore message.");
            return r;
        }
        r = helper::parse_uint64_required(payload, "clicks", out.clicks);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'clicks' missing or invalid in player_finish -> ignore message.");
            return r;
        }
        bool present;
        r = helper::parse_string_list_optional(payload, "path", out.path, present);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'path' invalid in player_finish -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace wikirace::core::protocol::parser::race
