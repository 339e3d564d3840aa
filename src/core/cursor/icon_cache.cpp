#include "wikirace/core/cursor/icon_cache.hpp"

#include "lcr/log/logger.hpp"


namespace wikirace::core::cursor {

namespace {

std::size_t slot_of(protocol::CursorType type) noexcept {
    switch (type) {
        case protocol::CursorType::Text: return 1;
        case protocol::CursorType::Hand: return 2;
        default:                         return 0;
    }
}

std::string build_svg(std::size_t slot) {
    std::string svg =
        "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"20\" height=\"20\" viewBox=\"0 0 24 24\" "
        "fill=\"currentColor\" stroke=\"white\" stroke-width=\"1.5\" stroke-linejoin=\"round\">";
    switch (slot) {
        case 1:   // text caret
            svg += "<path d=\"M9 3h6M9 21h6M12 3v18\" fill=\"none\" stroke=\"currentColor\" stroke-width=\"2\"/>";
            break;
        case 2:   // open hand
            svg += "<path d=\"M8 13V5.5a1.5 1.5 0 0 1 3 0V12m0-6.5v-1a1.5 1.5 0 0 1 3 0V12m0-6a1.5 1.5 0 0 1 3 0v7"
                   "m0-4a1.5 1.5 0 0 1 3 0v5a7 7 0 0 1-7 7h-1.5a7 7 0 0 1-5.6-2.8L3.4 14.6a1.5 1.5 0 0 1 2.3-1.9L8 15\"/>";
            break;
        default:  // arrow
            svg += "<path d=\"M4 3l16 7.5-6.8 1.9L10.7 20z\"/>";
            break;
    }
    svg += "</svg>";
    return svg;
}

} // namespace


IconCache& IconCache::instance() {
    static IconCache inst;
    return inst;
}

const std::string& IconCache::markup(protocol::CursorType type) {
    const std::size_t slot = slot_of(type);
    if (!built_[slot]) {
        icons_[slot] = build_svg(slot);
        built_[slot] = true;
        ++builds_;
        WR_DEBUG("[CURSOR] Icon markup built for '" << protocol::to_string(type) << "'");
    }
    return icons_[slot];
}

} // namespace wikirace::core::cursor
