#pragma once

#include "wikirace/core/protocol/schema/server.hpp"
#include "wikirace/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace wikirace::core::protocol::parser::race {

struct race_started {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& payload, schema::RaceStarted& out) noexcept {
        auto r = helper::require_object(payload);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Payload not an object in race_started -> ignore message.");
            return r;
        }
        // Both articles are optional: the room already carries them
        r = adapter::parse_text_optional(payload, "startArticle", out.start_article);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'startArticle' invalid in race_started -> ignore message.");
            return r;
        }
        r = adapter::parse_text_optional(payload, "endArticle", out.end_article);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'endArticle' invalid in race_started -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace wikirace::core::protocol::parser::race
