#pragma once

#include <cmath>

#include "wikirace/core/protocol/schema/server.hpp"
#include "wikirace/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace wikirace::core::protocol::parser::cursor {

struct cursor_update {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& payload, schema::CursorUpdate& out) noexcept {
        auto r = adapter::parse_id_required(payload, "playerId", out.player_id);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'playerId' missing or invalid in cursor_update -> ignore message.");
            return r;
        }
        r = adapter::parse_text_optional(payload, "playerName", out.player_name);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'playerName' invalid in cursor_update -> ignore message.");
            return r;
        }
        r = helper::parse_double_required(payload, "x", out.x);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'x' missing or invalid in cursor_update -> ignore message.");
            return r;
        }
        r = helper::parse_double_required(payload, "y", out.y);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'y' missing or invalid in cursor_update -> ignore message.");
            return r;
        }
        if (!std::isfinite(out.x) || !std::isfinite(out.y)) {
            WR_DEBUG("[PARSER] Non-finite coordinates in cursor_update -> ignore message.");
            return Result::InvalidValue;
        }
        r = adapter::parse_text_required(payload, "article", out.article);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'article' missing or invalid in cursor_update -> ignore message.");
            return r;
        }
        r = adapter::parse_cursor_type_optional(payload, "cursorType", out.cursor_type);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'cursorType' invalid in cursor_update -> ignore message.");
            return r;
        }
        r = adapter::parse_text_optional(payload, "anchorId", out.anchor_id);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'anchorId' invalid in cursor_update -> ignore message.");
            return r;
        }
        r = adapter::parse_text_optional(payload, "nextAnchorId", out.next_anchor_id);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'nextAnchorId' invalid in cursor_update -> ignore message.");
            return r;
        }
        r = helper::parse_double_optional(payload, "sectionRatio", out.section_ratio);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'sectionRatio' invalid in cursor_update -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace wikirace::core::protocol::parser::cursor
