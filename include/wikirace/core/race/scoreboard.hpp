#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "wikirace/core/notify/color.hpp"
#include "wikirace/core/protocol/schema/room_state.hpp"


namespace wikirace::core::race {

enum class Standing {
    Ahead,      // more clicks than the local player
    Behind,
    Neutral
};

[[nodiscard]]
inline constexpr std::string_view to_string(Standing s) noexcept {
    switch (s) {
        case Standing::Ahead:   return "ahead";
        case Standing::Behind:  return "behind";
        case Standing::Neutral: return "neutral";
    }
    return "unknown";
}

struct ScoreRow {
    std::string player_id;
    std::string name;
    std::uint64_t clicks{0};
    std::string diff;           // "+n", "0" or "-n" against the local player
    Standing standing{Standing::Neutral};
    bool finished{false};
    notify::Rgb color;
};

// Rows sorted by clicks, highest first. Ties keep player-id order.
[[nodiscard]]
std::vector<ScoreRow> build_scoreboard(const protocol::schema::RoomState& room, std::uint64_t local_clicks);

} // namespace wikirace::core::race
