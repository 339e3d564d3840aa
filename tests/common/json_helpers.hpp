#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <initializer_list>

// ----------------------------------------------------------------------------
// Server → client frames, written the way the game server emits them
// ----------------------------------------------------------------------------

namespace json::server {

inline std::string envelope(std::string_view type, const std::string& payload) {
    return R"({"type":")" + std::string(type) + R"(","payload":)" + payload + "}";
}

inline std::string string_list(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += ",";
        out += "\"" + items[i] + "\"";
    }
    return out + "]";
}

// Player object as found in room_state.players and player_joined
inline std::string player(const std::string& id, const std::string& name, const std::string& article,
                          std::uint64_t clicks = 0, bool finished = false,
                          const std::vector<std::string>& path = {}) {
    return R"({"id":")" + id + R"(","name":")" + name + R"(","currentArticle":")" + article +
           R"(","clicks":)" + std::to_string(clicks) + R"(,"path":)" + string_list(path) +
           R"(,"finished":)" + (finished ? "true" : "false") + R"(,"finishTime":0})";
}

struct PlayerEntry {
    std::string id;
    std::string name;
    std::string article;
    std::uint64_t clicks{0};
};

inline std::string room_state(const std::string& room_id, std::initializer_list<PlayerEntry> players,
                              const std::string& start, const std::string& end,
                              bool started = false, const std::string& host_id = "") {
    std::string ps = "{";
    bool first = true;
    for (const auto& p : players) {
        if (!first) ps += ",";
        first = false;
        ps += "\"" + p.id + "\":" + player(p.id, p.name, p.article, p.clicks);
    }
    ps += "}";
    std::string payload = R"({"id":")" + room_id + R"(","players":)" + ps +
                          R"(,"startArticle":")" + start + R"(","endArticle":")" + end +
                          R"(","started":)" + (started ? "true" : "false");
    if (!host_id.empty()) {
        payload += R"(,"hostId":")" + host_id + "\"";
    }
    payload += "}";
    return envelope("room_state", payload);
}

inline std::string player_joined(const std::string& id, const std::string& name, const std::string& article) {
    return envelope("player_joined", player(id, name, article));
}

inline std::string player_left(const std::string& id) {
    return envelope("player_left", R"({"playerId":")" + id + R"("})");
}

inline std::string race_started(const std::string& start, const std::string& end) {
    return envelope("race_started", R"({"startArticle":")" + start + R"(","endArticle":")" + end + R"("})");
}

inline std::string player_update(const std::string& id, const std::string& article, std::uint64_t clicks) {
    return envelope("player_update", R"({"playerId":")" + id + R"(","currentArticle":")" + article +
                                     R"(","clicks":)" + std::to_string(clicks) + "}");
}

inline std::string player_finish(const std::string& id, const std::string& name, std::int64_t time,
                                 std::uint64_t clicks, const std::vector<std::string>& path = {}) {
    return envelope("player_finish", R"({"playerId":")" + id + R"(","playerName":")" + name +
                                     R"(","time":)" + std::to_string(time) +
                                     R"(,"clicks":)" + std::to_string(clicks) +
                                     R"(,"path":)" + string_list(path) + "}");
}

// Fallback-only cursor sample (no anchors)
inline std::string cursor_update(const std::string& id, const std::string& name, double x, double y,
                                 const std::string& article) {
    return envelope("cursor_update", R"({"playerId":")" + id + R"(","playerName":")" + name +
                                     R"(","x":)" + std::to_string(x) + R"(,"y":)" + std::to_string(y) +
                                     R"(,"article":")" + article + R"("})");
}

inline std::string error(const std::string& text) {
    return envelope("error", R"({"error":")" + text + R"("})");
}

} // namespace json::server
