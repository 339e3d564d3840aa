#pragma once

#include <cstdint>
#include <string_view>


namespace wikirace::core::protocol::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    // ---- Parsing domain ----
    Ignored        = 0,            // Unknown or client-only message type
    InvalidJson    = 1,            // Frame is not JSON at all
    InvalidSchema  = 2,            // Missing required field, type mismatch, etc.
    InvalidValue   = 3,            // Field present but semantically invalid
    Parsed         = 4,            // Parsed successfully

    // ---- Delivery domain ----
    Delivered      = 8             // Parsed and handed to the handler
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ignored:        return "Ignored";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        case Result::Parsed:         return "Parsed";
        case Result::Delivered:      return "Delivered";
        default:                     return "unknown";
    }
}

} // namespace wikirace::core::protocol::parser
