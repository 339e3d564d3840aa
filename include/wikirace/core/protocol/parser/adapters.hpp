#pragma once

#include <string>
#include <string_view>

#include "wikirace/core/protocol/message_type.hpp"
#include "wikirace/core/protocol/cursor_type.hpp"
#include "wikirace/core/protocol/schema/player.hpp"
#include "wikirace/core/protocol/parser/helpers.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
Domain Adapters
================================================================================
Adapters turn primitive JSON fields into protocol types and enforce the
semantic rules helpers deliberately skip: non-empty identifiers, known
enumerations, sane ranges.

  InvalidSchema → field missing or of the wrong JSON type
  InvalidValue  → field well-typed but meaningless (empty id, negative time)
================================================================================
*/

namespace wikirace::core::protocol::parser::adapter {

// Envelope discriminator. Unknown strings map to MessageType::Unknown.
[[nodiscard]]
inline Result parse_message_type_required(const simdjson::dom::element& root, MessageType& out) noexcept {
    std::string_view sv;
    auto r = helper::parse_string_required(root, "type", sv);
    if (r != Result::Parsed) {
        return r;
    }
    out = to_message_type(sv);
    return Result::Parsed;
}

// Non-empty string identifier (player ids, room ids)
[[nodiscard]]
inline Result parse_id_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    std::string_view sv;
    auto r = helper::parse_string_required(obj, key, sv);
    if (r != Result::Parsed) {
        return r;
    }
    if (sv.empty()) {
        return Result::InvalidValue;
    }
    out.assign(sv.data(), sv.size());
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_text_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    std::string_view sv;
    auto r = helper::parse_string_required(obj, key, sv);
    if (r != Result::Parsed) {
        return r;
    }
    out.assign(sv.data(), sv.size());
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_text_optional(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    std::string_view sv;
    bool presence;
    auto r = helper::parse_string_optional(obj, key, sv, presence);
    if (r != Result::Parsed) {
        return r;
    }
    out.assign(sv.data(), sv.size());
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_text_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) noexcept {
    out.reset();
    std::string_view sv;
    bool presence;
    auto r = helper::parse_string_optional(obj, key, sv, presence);
    if (r != Result::Parsed) {
        return r;
    }
    if (presence) {
        out = std::string(sv);
    }
    return Result::Parsed;
}

// Unrecognized affordance names are treated as absent, not as an error
[[nodiscard]]
inline Result parse_cursor_type_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<CursorType>& out) noexcept {
    out.reset();
    std::string_view sv;
    bool presence;
    auto r = helper::parse_string_optional(obj, key, sv, presence);
    if (r != Result::Parsed) {
        return r;
    }
    if (presence) {
        const CursorType ct = to_cursor_type(sv);
        if (ct != CursorType::Unknown) {
            out = ct;
        }
    }
    return Result::Parsed;
}

// Elapsed race time in ms; negative values are rejected
[[nodiscard]]
inline Result parse_race_time_required(const simdjson::dom::element& obj, const char* key, std::int64_t& out) noexcept {
    auto r = helper::parse_int64_required(obj, key, out);
    if (r != Result::Parsed) {
        return r;
    }
    return (out < 0) ? Result::InvalidValue : Result::Parsed;
}

// ------------------------------------------------------------
// PLAYER OBJECT
// ------------------------------------------------------------
// id is mandatory; everything else defaults the way a freshly joined
// player looks.
[[nodiscard]]
inline Result parse_player(const simdjson::dom::element& obj, schema::Player& out) noexcept {
    auto r = helper::require_object(obj);
    if (r != Result::Parsed) {
        return r;
    }
    r = parse_id_required(obj, "id", out.id);
    if (r != Result::Parsed) {
        return r;
    }
    r = parse_text_optional(obj, "name", out.name);
    if (r != Result::Parsed) {
        return r;
    }
    r = parse_text_optional(obj, "currentArticle", out.current_article);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_uint64_optional(obj, "clicks", out.clicks, 0);
    if (r != Result::Parsed) {
        return r;
    }
    bool present;
    r = helper::parse_string_list_optional(obj, "path", out.path, present);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_bool_optional(obj, "finished", out.finished, false);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_int64_optional(obj, "finishTime", out.finish_time);
    if (r != Result::Parsed) {
        return r;
    }
    // finishTime 0 is the zero-value a server emits for "not finished yet"
    if (!out.finished && out.finish_time.has() && out.finish_time.value() == 0) {
        out.finish_time.reset();
    }
    return Result::Parsed;
}

} // namespace wikirace::core::protocol::parser::adapter
