#include "wikirace/core/cursor/codec.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "lcr/log/logger.hpp"


namespace wikirace::core::cursor {

namespace {

inline double clamp01(double v) noexcept {
    if (!std::isfinite(v)) {
        return 0.0;
    }
    return std::clamp(v, 0.0, 1.0);
}

inline double safe_fraction(double num, double den) noexcept {
    return (den > 0.0) ? num / den : 0.0;
}

inline double interpolate(double top, double bottom, double ratio) noexcept {
    return top + (bottom - top) * ratio;
}

} // namespace


Locator encode(const Layout& layout, double px, double py) {
    Locator out;
    out.x = safe_fraction(px, layout.width);
    out.y = safe_fraction(py, layout.height);

    std::vector<const Heading*> sorted;
    sorted.reserve(layout.headings.size());
    for (const auto& h : layout.headings) {
        sorted.push_back(&h);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Heading* a, const Heading* b) { return a->top < b->top; });

    const Heading* prev = nullptr;
    const Heading* next = nullptr;
    for (const Heading* h : sorted) {
        if (h->top <= py) {
            prev = h;
        } else {
            next = h;
            break;
        }
    }

    const double top    = prev ? prev->top : 0.0;
    const double bottom = next ? next->top : layout.height;

    if (prev) out.anchor_id = prev->anchor_id;
    if (next) out.next_anchor_id = next->anchor_id;
    out.section_ratio = (bottom > top) ? clamp01((py - top) / (bottom - top)) : 0.0;

    WR_TRACE("[CURSOR] encode (" << px << "," << py << ") -> prev="
             << (prev ? prev->anchor_id : std::string("<top>")) << " next="
             << (next ? next->anchor_id : std::string("<bottom>")) << " ratio=" << out.section_ratio.value());
    return out;
}

Position decode(const Layout& layout, const Locator& loc) noexcept {
    Position out;
    out.x = loc.x * layout.width;

    if (loc.section_ratio.has()) {
        const double ratio = clamp01(loc.section_ratio.value());
        const Heading* prev = loc.anchor_id.has() ? layout.find(loc.anchor_id.value()) : nullptr;
        const Heading* next = loc.next_anchor_id.has() ? layout.find(loc.next_anchor_id.value()) : nullptr;

        if (prev && next) {
            out.y = interpolate(prev->top, next->top, ratio);
            out.tier = Tier::BothAnchors;
            return out;
        }
        if (prev) {
            out.y = interpolate(prev->top, layout.height, ratio);
            out.tier = Tier::PrevAnchor;
            return out;
        }
        if (next) {
            out.y = interpolate(0.0, next->top, ratio);
            out.tier = Tier::NextAnchor;
            return out;
        }
    }

    out.y = loc.y * layout.height;
    out.tier = Tier::Fallback;
    return out;
}

} // namespace wikirace::core::cursor
