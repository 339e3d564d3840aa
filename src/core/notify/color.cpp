#include "wikirace/core/notify/color.hpp"

#include <algorithm>
#include <cmath>


namespace wikirace::core::notify {

namespace {

// Decodes one UTF-8 scalar starting at `i` and advances `i`.
// Malformed sequences yield the raw byte.
std::uint32_t next_scalar(std::string_view s, std::size_t& i) noexcept {
    const auto b0 = static_cast<unsigned char>(s[i]);
    std::size_t len = 1;
    std::uint32_t cp = b0;
    if      ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; }

    if (len == 1 || i + len > s.size()) {
        ++i;
        return b0;
    }
    for (std::size_t k = 1; k < len; ++k) {
        const auto bk = static_cast<unsigned char>(s[i + k]);
        if ((bk & 0xC0) != 0x80) {
            ++i;
            return b0;
        }
        cp = (cp << 6) | (bk & 0x3F);
    }
    i += len;
    return cp;
}

inline std::int32_t mix(std::int32_t h, std::uint32_t unit) noexcept {
    // (h << 5) - h + unit with 32-bit wrap-around
    const auto u = static_cast<std::uint32_t>(h);
    return static_cast<std::int32_t>((u << 5) - u + unit);
}

} // namespace


std::string Rgb::to_css() const {
    return "rgb(" + std::to_string(r) + ", " + std::to_string(g) + ", " + std::to_string(b) + ")";
}

Rgb Rgb::tinted(double white) const noexcept {
    white = std::clamp(white, 0.0, 1.0);
    auto channel = [white](std::uint8_t c) {
        const double v = std::floor(c * (1.0 - white) + 255.0 * white);
        return static_cast<std::uint8_t>(std::min(255.0, v));
    };
    return Rgb{channel(r), channel(g), channel(b)};
}

std::int32_t name_hash(std::string_view utf8_name) noexcept {
    std::int32_t h = 0;
    std::size_t i = 0;
    while (i < utf8_name.size()) {
        const std::uint32_t cp = next_scalar(utf8_name, i);
        if (cp >= 0x10000) {
            // Surrogate pair
            const std::uint32_t v = cp - 0x10000;
            h = mix(h, 0xD800 + (v >> 10));
            h = mix(h, 0xDC00 + (v & 0x3FF));
        } else {
            h = mix(h, cp);
        }
    }
    return h;
}

std::size_t palette_index(std::string_view name) noexcept {
    const std::int64_t h = name_hash(name);
    const std::int64_t magnitude = (h < 0) ? -h : h;
    return static_cast<std::size_t>(magnitude % static_cast<std::int64_t>(PALETTE.size()));
}

} // namespace wikirace::core::notify
