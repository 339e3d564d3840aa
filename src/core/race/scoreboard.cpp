#include "wikirace/core/race/scoreboard.hpp"

#include <algorithm>


namespace wikirace::core::race {

std::vector<ScoreRow> build_scoreboard(const protocol::schema::RoomState& room, std::uint64_t local_clicks) {
    std::vector<ScoreRow> rows;
    rows.reserve(room.players.size());

    for (const auto& [id, p] : room.players) {
        ScoreRow row;
        row.player_id = id;
        row.name = p.name;
        row.clicks = p.clicks;
        row.finished = p.finished;
        row.color = notify::player_color(p.name);

        const auto diff = static_cast<std::int64_t>(p.clicks) - static_cast<std::int64_t>(local_clicks);
        if (diff > 0) {
            row.diff = "+" + std::to_string(diff);
            row.standing = Standing::Ahead;
        } else if (diff < 0) {
            row.diff = std::to_string(diff);
            row.standing = Standing::Behind;
        } else {
            row.diff = "0";
            row.standing = Standing::Neutral;
        }
        rows.push_back(std::move(row));
    }

    std::stable_sort(rows.begin(), rows.end(),
                     [](const ScoreRow& a, const ScoreRow& b) { return a.clicks > b.clicks; });
    return rows;
}

} // namespace wikirace::core::race
