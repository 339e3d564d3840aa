#include "wikirace/core/cursor/affordance.hpp"

#include <string_view>


namespace wikirace::core::cursor {

namespace {

bool has_ancestor_or_self(const Element& el, std::string_view tag) noexcept {
    for (const Element* e = &el; e != nullptr; e = e->parent) {
        if (e->tag == tag) {
            return true;
        }
    }
    return false;
}

} // namespace


lcr::optional<protocol::CursorType> infer_affordance(const Element& target) {
    using protocol::CursorType;

    if (has_ancestor_or_self(target, "a") || has_ancestor_or_self(target, "img")) {
        return CursorType::Hand;
    }
    if (target.tag == "input" || target.tag == "textarea" || target.content_editable) {
        return CursorType::Text;
    }

    const std::string& cursor = target.computed_cursor;
    if (cursor == "text") {
        return CursorType::Text;
    }
    if (cursor == "pointer" || cursor == "grab" || cursor == "grabbing") {
        return CursorType::Pointer;
    }
    if (cursor == "auto" || cursor == "default") {
        for (const Element* e = &target; e != nullptr; e = e->parent) {
            if (e->computed_cursor == "text") {
                return CursorType::Text;
            }
            if (e->content_root) {
                break;
            }
        }
    }
    return {};
}

} // namespace wikirace::core::cursor
