#pragma once

#include <array>
#include <string>
#include <cstddef>

#include "wikirace/core/protocol/cursor_type.hpp"


namespace wikirace::core::cursor {

// Process-wide cache of cursor icon markup (SVG), built lazily on first use
// and never invalidated: the icons are static.
class IconCache {
public:
    [[nodiscard]] static IconCache& instance();

    IconCache(const IconCache&) = delete;
    IconCache& operator=(const IconCache&) = delete;

    // Unknown maps to the default pointer icon
    [[nodiscard]] const std::string& markup(protocol::CursorType type);

    // Number of icons built so far (each built at most once)
    [[nodiscard]] std::size_t builds() const noexcept { return builds_; }

private:
    IconCache() = default;

    std::array<std::string, 3> icons_;
    std::array<bool, 3> built_{false, false, false};
    std::size_t builds_{0};
};

} // namespace wikirace::core::cursor
