#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "wikirace/core/protocol/schema/player.hpp"
#include "wikirace/core/protocol/cursor_type.hpp"
#include "lcr/optional.hpp"

namespace wikirace::core::protocol::schema {

// Server → client payloads other than room_state / player_joined.

struct PlayerLeft {
    std::string player_id;
};

struct RaceStarted {
    std::string start_article;
    std::string end_article;
};

struct PlayerUpdate {
    std::string player_id;
    std::string current_article;
    std::uint64_t clicks{0};
};

struct PlayerFinish {
    std::string player_id;
    std::string player_name;
    std::int64_t time{0};                 // ms since race start
    std::uint64_t clicks{0};
    std::vector<std::string> path;
};

// A remote pointer sample. Vertical locator: anchors + section ratio when
// present, plain fraction `y` otherwise.
struct CursorUpdate {
    std::string player_id;
    std::string player_name;
    double x{0.0};
    double y{0.0};
    std::string article;
    lcr::optional<CursorType> cursor_type;
    lcr::optional<std::string> anchor_id;
    lcr::optional<std::string> next_anchor_id;
    lcr::optional<double> section_ratio;
};

struct ErrorNotice {
    std::string error;
};

} // namespace wikirace::core::protocol::schema
