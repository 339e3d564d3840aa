#pragma once

#include <string>
#include <string_view>
#include <vector>


namespace wikirace::core::cursor {

// A structural heading of the rendered article: a stable anchor id plus its
// top offset (px) relative to the article container.
struct Heading {
    std::string anchor_id;
    double top{0.0};
};

// Local rendering geometry of one article, supplied by the content provider.
// Headings may be given in any order.
struct Layout {
    double width{0.0};
    double height{0.0};
    std::vector<Heading> headings;

    // nullptr when the anchor is not part of this rendering
    [[nodiscard]]
    inline const Heading* find(std::string_view anchor_id) const noexcept {
        if (anchor_id.empty()) {
            return nullptr;
        }
        for (const auto& h : headings) {
            if (h.anchor_id == anchor_id) {
                return &h;
            }
        }
        return nullptr;
    }
};

} // namespace wikirace::core::cursor
