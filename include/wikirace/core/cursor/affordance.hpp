#pragma once

#include <string>

#include "wikirace/core/protocol/cursor_type.hpp"
#include "lcr/optional.hpp"


namespace wikirace::core::cursor {

// What the presentation layer knows about the element under the pointer.
// `parent` links form the ancestor chain up to (and including) the article
// content root, which has `content_root` set.
struct Element {
    std::string tag;                 // lowercase tag name ("a", "img", "p", ...)
    std::string computed_cursor;     // computed CSS cursor ("auto", "text", ...)
    bool content_editable{false};
    bool content_root{false};
    const Element* parent{nullptr};
};

// Infers the pointer affordance hint to transmit alongside a cursor sample:
//   link or image (self or ancestor)       -> Hand
//   input / textarea / content-editable    -> Text
//   computed cursor text                   -> Text
//   computed cursor pointer/grab/grabbing  -> Pointer
//   computed cursor auto/default           -> Text if an ancestor up to the
//                                             content root shows a text cursor
// Anything else yields no hint.
[[nodiscard]]
lcr::optional<protocol::CursorType> infer_affordance(const Element& target);

} // namespace wikirace::core::cursor
