#pragma once

#include <map>
#include <string>
#include <ostream>

#include "wikirace/core/protocol/schema/player.hpp"

namespace wikirace::core::protocol::schema {

// ===============================================
// ROOM STATE (full snapshot)
// ===============================================
struct RoomState {
    std::string id;
    std::map<std::string, Player> players;   // keyed by player id
    std::string start_article;
    std::string end_article;
    bool started{false};
    std::string host_id;                     // empty when the server omits it

    inline void write_json(std::string& out) const {
        out += "{\"id\":";
        lcr::json::append_string(out, id);
        out += ",\"players\":{";
        bool first = true;
        for (const auto& [key, player] : players) {
            if (!first) out += ',';
            first = false;
            lcr::json::append_string(out, key);
            out += ':';
            player.write_json(out);
        }
        out += "},\"startArticle\":";
        lcr::json::append_string(out, start_article);
        out += ",\"endArticle\":";
        lcr::json::append_string(out, end_article);
        out += ",\"started\":";
        lcr::json::append_bool(out, started);
        out += ",\"hostId\":";
        lcr::json::append_string(out, host_id);
        out += '}';
    }

    friend bool operator==(const RoomState&, const RoomState&) = default;
};

inline std::ostream& operator<<(std::ostream& os, const RoomState& r) {
    return os << "[RoomState] {id=" << r.id
              << ", players=" << r.players.size()
              << ", start=" << r.start_article
              << ", end=" << r.end_article
              << ", started=" << (r.started ? "true" : "false")
              << ", host=" << r.host_id << "}";
}

} // namespace wikirace::core::protocol::schema
