#pragma once

#include <cstdint>
#include <string>

#include "wikirace/core/protocol/message_type.hpp"
#include "wikirace/core/protocol/cursor_type.hpp"
#include "wikirace/core/protocol/json_writable.hpp"
#include "lcr/optional.hpp"
#include "lcr/json.hpp"

namespace wikirace::core {
namespace protocol {
namespace schema {

// ===============================================
// CLIENT → SERVER REQUESTS
// ===============================================

struct JoinRoom {
    static constexpr MessageType type = MessageType::JoinRoom;

    std::string room_id;
    std::string player_name;
    std::string start_article;
    std::string end_article;

    inline void write_json(std::string& out) const {
        out += "{\"roomId\":";
        lcr::json::append_string(out, room_id);
        out += ",\"playerName\":";
        lcr::json::append_string(out, player_name);
        out += ",\"startArticle\":";
        lcr::json::append_string(out, start_article);
        out += ",\"endArticle\":";
        lcr::json::append_string(out, end_article);
        out += '}';
    }
};

struct RejoinRoom {
    static constexpr MessageType type = MessageType::RejoinRoom;

    std::string room_id;
    std::string player_name;

    inline void write_json(std::string& out) const {
        out += "{\"roomId\":";
        lcr::json::append_string(out, room_id);
        out += ",\"playerName\":";
        lcr::json::append_string(out, player_name);
        out += '}';
    }
};

struct LeaveRoom {
    static constexpr MessageType type = MessageType::LeaveRoom;

    inline void write_json(std::string& out) const {
        out += "{}";
    }
};

struct StartRace {
    static constexpr MessageType type = MessageType::StartRace;

    inline void write_json(std::string& out) const {
        out += "{}";
    }
};

struct Navigate {
    static constexpr MessageType type = MessageType::Navigate;

    std::string article;

    inline void write_json(std::string& out) const {
        out += "{\"article\":";
        lcr::json::append_string(out, article);
        out += '}';
    }
};

struct Finish {
    static constexpr MessageType type = MessageType::Finish;

    std::int64_t time{0};   // elapsed ms since the local race clock started

    inline void write_json(std::string& out) const {
        out += "{\"time\":";
        lcr::json::append_int(out, time);
        out += '}';
    }
};

// Optional members are omitted from the frame when absent
struct Cursor {
    static constexpr MessageType type = MessageType::Cursor;

    double x{0.0};
    double y{0.0};
    std::string article;
    lcr::optional<CursorType> cursor_type;
    lcr::optional<std::string> anchor_id;
    lcr::optional<std::string> next_anchor_id;
    lcr::optional<double> section_ratio;

    inline void write_json(std::string& out) const {
        out += "{\"x\":";
        lcr::json::append_double(out, x);
        out += ",\"y\":";
        lcr::json::append_double(out, y);
        out += ",\"article\":";
        lcr::json::append_string(out, article);
        if (cursor_type.has() && cursor_type.value() != CursorType::Unknown) {
            out += ",\"cursorType\":";
            lcr::json::append_string(out, to_string(cursor_type.value()));
        }
        if (anchor_id.has()) {
            out += ",\"anchorId\":";
            lcr::json::append_string(out, anchor_id.value());
        }
        if (next_anchor_id.has()) {
            out += ",\"nextAnchorId\":";
            lcr::json::append_string(out, next_anchor_id.value());
        }
        if (section_ratio.has()) {
            out += ",\"sectionRatio\":";
            lcr::json::append_double(out, section_ratio.value());
        }
        out += '}';
    }
};

// Host only
struct UpdateRoom {
    static constexpr MessageType type = MessageType::UpdateRoom;

    std::string start_article;
    std::string end_article;

    inline void write_json(std::string& out) const {
        out += "{\"startArticle\":";
        lcr::json::append_string(out, start_article);
        out += ",\"endArticle\":";
        lcr::json::append_string(out, end_article);
        out += '}';
    }
};

static_assert(JsonWritable<JoinRoom>);
static_assert(JsonWritable<RejoinRoom>);
static_assert(JsonWritable<LeaveRoom>);
static_assert(JsonWritable<StartRace>);
static_assert(JsonWritable<Navigate>);
static_assert(JsonWritable<Finish>);
static_assert(JsonWritable<Cursor>);
static_assert(JsonWritable<UpdateRoom>);

} // namespace schema
} // namespace protocol
} // namespace wikirace::core
