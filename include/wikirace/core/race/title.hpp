#pragma once

#include <string>
#include <string_view>


namespace wikirace::core::race {

// Canonical form of an article title for destination matching:
// runs of whitespace/underscores collapse to one '_', ASCII letters are
// lowercased, leading and trailing '_' are trimmed.
[[nodiscard]] std::string normalize_title(std::string_view title);

[[nodiscard]] inline bool same_article(std::string_view a, std::string_view b) {
    return normalize_title(a) == normalize_title(b);
}

// Human-readable title: underscores become spaces
[[nodiscard]] std::string display_title(std::string_view title);

// display_title() cut to `max_length` characters with a trailing "..."
[[nodiscard]] std::string truncated_title(std::string_view title, std::size_t max_length = 25);

} // namespace wikirace::core::race
