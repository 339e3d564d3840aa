#pragma once

#include <string>
#include <string_view>
#include <ostream>

#include "wikirace/core/cursor/layout.hpp"
#include "lcr/optional.hpp"


namespace wikirace::core::cursor {

/*
===============================================================================
 Cursor position codec
===============================================================================

Two clients rendering the same article may lay it out at very different
heights. The vertical position therefore travels relative to the headings
around the pointer (which exist in every rendering), with a plain fraction of
the document height as the last-resort fallback.

Encode:   prev = last heading with top <= y, next = first heading below it
          ratio = (y - prevTop) / (nextTop - prevTop), clamped to [0,1]
          (document top / bottom stand in for a missing prev / next)

Decode picks the highest tier it can satisfy against the LOCAL layout:

    BothAnchors   prevTop + (nextTop - prevTop) * ratio
    PrevAnchor    prevTop + (height  - prevTop) * ratio
    NextAnchor    0       + (nextTop - 0)       * ratio
    Fallback      y * height
===============================================================================
*/

// Content-relative cursor locator as it travels on the wire
struct Locator {
    double x{0.0};                           // fraction of content width
    double y{0.0};                           // fallback fraction of content height
    lcr::optional<std::string> anchor_id;
    lcr::optional<std::string> next_anchor_id;
    lcr::optional<double> section_ratio;
};

enum class Tier {
    BothAnchors,
    PrevAnchor,
    NextAnchor,
    Fallback
};

[[nodiscard]]
inline constexpr std::string_view to_string(Tier t) noexcept {
    switch (t) {
        case Tier::BothAnchors: return "BothAnchors";
        case Tier::PrevAnchor:  return "PrevAnchor";
        case Tier::NextAnchor:  return "NextAnchor";
        case Tier::Fallback:    return "Fallback";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, Tier t) {
    return os << to_string(t);
}

struct Position {
    double x{0.0};     // px from the content left edge
    double y{0.0};     // px from the content top edge
    Tier tier{Tier::Fallback};
};

// px/py are relative to the article container
[[nodiscard]] Locator encode(const Layout& layout, double px, double py);

[[nodiscard]] Position decode(const Layout& layout, const Locator& loc) noexcept;

} // namespace wikirace::core::cursor
