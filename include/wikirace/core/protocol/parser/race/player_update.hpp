#pragma once

#include "wikirace/core/protocol/schema/server.hpp"
#include "wikirace/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace wikirace::core::protocol::parser::race {

struct player_update {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& payload, schema::PlayerUpdate& out) noexcept {
        auto r = adapter::parse_id_required(payload, "playerId", out.player_id);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'playerId' missing or invalid in player_update -> ignore message.");
            return r;
        }
        r = adapter::parse_text_required(payload, "currentArticle", out.current_article);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'currentArticle' missing or invalid in player_update -> ignore message.");
            return r;
        }
        r = helper::parse_uint64_required(payload, "clicks", out.clicks);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'clicks' missing or invalid in player_update -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace wikirace::core::protocol::parser::race
