#pragma once

#include <cstdint>
#include <string_view>


namespace wikirace::core::protocol {

// Pointer affordance hint carried by cursor samples
enum class CursorType : uint8_t {
    Pointer,
    Text,
    Hand,
    Unknown
};

[[nodiscard]]
inline constexpr std::string_view to_string(CursorType c) noexcept {
    switch (c) {
        case CursorType::Pointer: return "pointer";
        case CursorType::Text:    return "text";
        case CursorType::Hand:    return "hand";
        default:                  return "unknown";
    }
}

[[nodiscard]]
inline constexpr CursorType to_cursor_type(std::string_view s) noexcept {
    if (s == "pointer") return CursorType::Pointer;
    if (s == "text")    return CursorType::Text;
    if (s == "hand")    return CursorType::Hand;
    return CursorType::Unknown;
}

} // namespace wikirace::core::protocol
