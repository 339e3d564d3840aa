#include "wikirace/core/race/title.hpp"

#include <cctype>


namespace wikirace::core::race {

std::string normalize_title(std::string_view title) {
    std::string out;
    out.reserve(title.size());
    bool in_gap = false;
    for (char ch : title) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isspace(c) || c == '_') {
            in_gap = true;
            continue;
        }
        if (in_gap && !out.empty()) {
            out += '_';
        }
        in_gap = false;
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

std::string display_title(std::string_view title) {
    std::string out(title);
    for (char& c : out) {
        if (c == '_') {
            c = ' ';
        }
    }
    return out;
}

std::string truncated_title(std::string_view title, std::size_t max_length) {
    std::string out = display_title(title);
    if (out.size() <= max_length) {
        return out;
    }
    out.resize(max_length);
    out += "...";
    return out;
}

} // namespace wikirace::core::race
