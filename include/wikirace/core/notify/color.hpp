#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>


namespace wikirace::core::notify {

struct Rgb {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};

    // "rgb(r, g, b)"
    [[nodiscard]] std::string to_css() const;

    // Mix with white; `white` is the share of white in [0,1]
    [[nodiscard]] Rgb tinted(double white) const noexcept;

    friend bool operator==(const Rgb&, const Rgb&) = default;
};

inline constexpr std::array<Rgb, 8> PALETTE = {{
    {255,  71,  87},
    { 52, 152, 219},
    { 46, 204, 113},
    {241, 196,  15},
    {155,  89, 182},
    {230, 126,  34},
    { 26, 188, 156},
    {231,  76,  60},
}};

// 32-bit rolling hash (h = h * 31 + unit) over the UTF-16 code units of a
// display name. The same name always maps to the same palette slot, no
// matter who else is in the room.
[[nodiscard]] std::int32_t name_hash(std::string_view utf8_name) noexcept;

[[nodiscard]] std::size_t palette_index(std::string_view name) noexcept;

[[nodiscard]] inline Rgb player_color(std::string_view name) noexcept {
    return PALETTE[palette_index(name)];
}

// Border and avatar-letter shades used next to the base colour
[[nodiscard]] inline Rgb border_color(const Rgb& base) noexcept { return base.tinted(0.3); }
[[nodiscard]] inline Rgb letter_color(const Rgb& base) noexcept { return base.tinted(0.8); }

} // namespace wikirace::core::notify
