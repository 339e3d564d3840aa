#pragma once

#include <cstdint>
#include <cmath>
#include <string>
#include <string_view>
#include <vector>

#include "wikirace/core/protocol/parser/result.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Strict extractors for primitive JSON values out of simdjson DOM elements.

  • Enforce structural rules (object presence, type correctness)
  • Parse bool, integer, double, string and string-list fields
  • Signal optional-field presence explicitly
  • Never interpret values semantically, never log, never throw

Higher layers (adapters, message parsers) add domain validation and
diagnostics on top of these.
================================================================================
*/


namespace wikirace::core::protocol::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ------------------------------------------------------------
// REQUIRED OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    out = field.value_unsafe();
    return require_object(out);
}


// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// Accepts integral JSON numbers; an integral-valued double (e.g. 1234.0) is
// tolerated since some peers serialize every number as a float.
[[nodiscard]]
inline Result parse_int64_required(const simdjson::dom::element& obj, const char* key, std::int64_t& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (!field.get(out)) {
        return Result::Parsed;
    }
    double d;
    if (field.get(d)) {
        return Result::InvalidSchema;
    }
    if (!std::isfinite(d) || std::trunc(d) != d) {
        return Result::InvalidSchema;
    }
    out = static_cast<std::int64_t>(d);
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_double_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================
// Absent and JSON null are both treated as "not present".

[[nodiscard]]
inline bool is_absent(const simdjson::simdjson_result<simdjson::dom::element>& field) noexcept {
    return field.error() || field.value_unsafe().is_null();
}

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, bool& out, bool fallback) noexcept {
    out = fallback;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (is_absent(field)) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_uint64_optional(const simdjson::dom::element& obj, const char* key, std::uint64_t& out, std::uint64_t fallback) noexcept {
    out = fallback;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (is_absent(field)) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::int64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (is_absent(field)) {
        return Result::Parsed;
    }
    std::int64_t v;
    auto r = parse_int64_required(obj, key, v);
    if (r != Result::Parsed) {
        return r;
    }
    out = v;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_double_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<double>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (is_absent(field)) {
        return Result::Parsed;
    }
    double v;
    if (field.get(v)) {
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& presence) noexcept {
    presence = false;
    out = std::string_view{};
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (is_absent(field)) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    presence = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_list_optional(const simdjson::dom::element& obj, const char* key, std::vector<std::string>& out, bool& present) noexcept {
    out.clear();
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (is_absent(field)) {
        return Result::Parsed;
    }
    simdjson::dom::array arr;
    if (field.get(arr)) {
        return Result::InvalidSchema;
    }
    for (auto v : arr) {
        std::string_view sv;
        if (v.get(sv)) {
            out.clear();
            return Result::InvalidSchema;
        }
        out.emplace_back(sv);
    }
    present = true;
    return Result::Parsed;
}

} // namespace wikirace::core::protocol::parser::helper
