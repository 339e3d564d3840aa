#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <ostream>

#include "lcr/optional.hpp"
#include "lcr/json.hpp"

namespace wikirace::core {
namespace protocol {
namespace schema {

// ===============================================
// PLAYER
// ===============================================
// Invariants (server-maintained, mirrored by the client):
//   - id is stable for the session and is the only identity
//   - path.size() == clicks (the start article is not a click)
//   - finished never reverts; finish_time is set at most once
struct Player {
    std::string id;
    std::string name;
    std::string current_article;
    std::uint64_t clicks{0};
    std::vector<std::string> path;
    bool finished{false};
    lcr::optional<std::int64_t> finish_time;   // ms since race start

    inline void write_json(std::string& out) const {
        out += "{\"id\":";
        lcr::json::append_string(out, id);
        out += ",\"name\":";
        lcr::json::append_string(out, name);
        out += ",\"currentArticle\":";
        lcr::json::append_string(out, current_article);
        out += ",\"clicks\":";
        lcr::json::append_uint(out, clicks);
        out += ",\"path\":[";
        for (std::size_t i = 0; i < path.size(); ++i) {
            if (i) out += ',';
            lcr::json::append_string(out, path[i]);
        }
        out += "],\"finished\":";
        lcr::json::append_bool(out, finished);
        if (finish_time.has()) {
            out += ",\"finishTime\":";
            lcr::json::append_int(out, finish_time.value());
        }
        out += '}';
    }

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        write_json(out);
        return out;
    }

    friend bool operator==(const Player&, const Player&) = default;
};

inline std::ostream& operator<<(std::ostream& os, const Player& p) {
    os << "[Player] {id=" << p.id
       << ", name=" << p.name
       << ", article=" << p.current_article
       << ", clicks=" << p.clicks
       << ", finished=" << (p.finished ? "true" : "false");
    if (p.finish_time.has()) {
        os << ", finish_time=" << p.finish_time.value();
    }
    return os << "}";
}

} // namespace schema
} // namespace protocol
} // namespace wikirace::core
