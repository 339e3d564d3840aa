#pragma once

#include "wikirace/core/protocol/schema/server.hpp"
#include "wikirace/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace wikirace::core::protocol::parser::system {

struct error_notice {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& payload, schema::ErrorNotice& out) noexcept {
        auto r = adapter::parse_text_required(payload, "error", out.error);
        if (r != Result::Parsed) {
            WR_DEBUG("[PARSER] Field 'error' missing or invalid in error message -> ignore message.");
        }
        return r;
    }
};

} // namespace wikirace::core::protocol::parser::system
