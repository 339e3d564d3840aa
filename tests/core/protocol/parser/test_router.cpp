/*
================================================================================
Inbound Router - Unit Tests
================================================================================

Every server message type is parsed from its wire form and delivered to the
handler as a typed value. Malformed frames are reported and never delivered:

  • InvalidJson    → not JSON at all
  • InvalidSchema  → required field missing or of the wrong type
  • InvalidValue   → well-typed but meaningless (empty id, negative time)
  • Ignored        → unknown type, or a client → server type echoed back
================================================================================
*/

#include <iostream>
#include <string>
#include <vector>

#include "wikirace/core/protocol/parser/router.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace wikirace::core;
using namespace wikirace::core::protocol;
using parser::Result;

// -----------------------------------------------------------------------------
// Recording handler
// -----------------------------------------------------------------------------
struct Recorder {
    std::vector<schema::RoomState> rooms;
    std::vector<schema::Player> joined;
    std::vector<schema::PlayerLeft> left;
    std::vector<schema::RaceStarted> started;
    std::vector<schema::PlayerUpdate> updates;
    std::vector<schema::PlayerFinish> finishes;
    std::vector<schema::CursorUpdate> cursors;
    std::vector<schema::ErrorNotice> errors;
    std::vector<std::string> order;

    void on_room_state(const schema::RoomState& m)       { rooms.push_back(m);    order.push_back("room_state"); }
    void on_player_joined(const schema::Player& m)       { joined.push_back(m);   order.push_back("player_joined"); }
    void on_player_left(const schema::PlayerLeft& m)     { left.push_back(m);     order.push_back("player_left"); }
    void on_race_started(const schema::RaceStarted& m)   { started.push_back(m);  order.push_back("race_started"); }
    void on_player_update(const schema::PlayerUpdate& m) { updates.push_back(m);  order.push_back("player_update"); }
    void on_player_finish(const schema::PlayerFinish& m) { finishes.push_back(m); order.push_back("player_finish"); }
    void on_cursor_update(const schema::CursorUpdate& m) { cursors.push_back(m);  order.push_back("cursor_update"); }
    void on_error_notice(const schema::ErrorNotice& m)   { errors.push_back(m);   order.push_back("error"); }
};

static_assert(parser::MessageHandler<Recorder>);


// ------------------------------------------------------------
// POSITIVE CASES
// ------------------------------------------------------------

void test_room_state() {
    std::cout << "[TEST] room_state..." << std::endl;
    Recorder rec;
    parser::Router<Recorder> router{rec};

    auto r = router.parse_and_route(json::server::room_state("R1",
        { {"p1", "Alice", "Cat", 0}, {"p2", "Bob", "Animal", 3} }, "Cat", "Dog", false, "p1"));
    TEST_CHECK(r == Result::Delivered);
    TEST_CHECK(rec.rooms.size() == 1);

    const auto& room = rec.rooms[0];
    TEST_CHECK(room.id == "R1");
    TEST_CHECK(room.players.size() == 2);
    TEST_CHECK(room.players.at("p2").name == "Bob");
    TEST_CHECK(room.players.at("p2").current_article == "Animal");
    TEST_CHECK(room.players.at("p2").clicks == 3);
    TEST_CHECK(!room.players.at("p2").finished);
    TEST_CHECK(!room.players.at("p2").finish_time.has());   // 0 means "not finished"
    TEST_CHECK(room.start_article == "Cat");
    TEST_CHECK(room.end_article == "Dog");
    TEST_CHECK(!room.started);
    TEST_CHECK(room.host_id == "p1");
    std::cout << "[TEST] OK\n";
}

void test_room_state_without_host() {
    std::cout << "[TEST] room_state without hostId..." << std::endl;
    Recorder rec;
    parser::Router<Recorder> router{rec};

    TEST_CHECK(router.parse_and_route(json::server::room_state("R1", {}, "Cat", "Dog", true)) == Result::Delivered);
    TEST_CHECK(rec.rooms[0].players.empty());
    TEST_CHECK(rec.rooms[0].started);
    TEST_CHECK(rec.rooms[0].host_id.empty());
    std::cout << "[TEST] OK\n";
}

void test_incremental_messages() {
    std::cout << "[TEST] incremental messages keep server order..." << std::endl;
    Recorder rec;
    parser::Router<Recorder> router{rec};

    TEST_CHECK(router.parse_and_route(json::server::player_joined("p3", "Cara", "Cat")) == Result::Delivered);
    TEST_CHECK(router.parse_and_route(json::server::race_started("Cat", "Dog")) == Result::Delivered);
    TEST_CHECK(router.parse_and_route(json::server::player_update("p3", "Animal", 1)) == Result::Delivered);
    TEST_CHECK(router.parse_and_route(json::server::player_finish("p3", "Cara", 4200, 2, {"Animal", "Dog"})) == Result::Delivered);
    TEST_CHECK(router.parse_and_route(json::server::player_left("p3")) == Result::Delivered);
    TEST_CHECK(router.parse_and_route(json::server::error("Room not found")) == Result::Delivered);

    const std::vector<std::string> expected = {
        "player_joined", "race_started", "player_update", "player_finish", "player_left", "error"
    };
    TEST_CHECK(rec.order == expected);

    TEST_CHECK(rec.joined[0].id == "p3" && rec.joined[0].name == "Cara");
    TEST_CHECK(rec.started[0].end_article == "Dog");
    TEST_CHECK(rec.updates[0].current_article == "Animal" && rec.updates[0].clicks == 1);
    TEST_CHECK(rec.finishes[0].time == 4200);
    TEST_CHECK(rec.finishes[0].clicks == 2);
    TEST_CHECK(rec.finishes[0].path.size() == 2 && rec.finishes[0].path[1] == "Dog");
    TEST_CHECK(rec.left[0].player_id == "p3");
    TEST_CHECK(rec.errors[0].error == "Room not found");
    std::cout << "[TEST] OK\n";
}

void test_cursor_update_full() {
    std::cout << "[TEST] cursor_update with anchors..." << std::endl;
    Recorder rec;
    parser::Router<Recorder> router{rec};

    constexpr std::string_view frame = R"json(
    {
        "type": "cursor_update",
        "payload": {
            "playerId": "p2",
            "playerName": "Bob",
            "x": 0.5,
            "y": 0.25,
            "article": "Cat",
            "cursorType": "hand",
            "anchorId": "History",
            "nextAnchorId": "Biology",
            "sectionRatio": 0.75
        }
    }
    )json";

    TEST_CHECK(router.parse_and_route(frame) == Result::Delivered);
    const auto& c = rec.cursors[0];
    TEST_CHECK(c.player_id == "p2");
    TEST_CHECK(c.x == 0.5 && c.y == 0.25);
    TEST_CHECK(c.cursor_type.has() && c.cursor_type.value() == CursorType::Hand);
    TEST_CHECK(c.anchor_id.has() && c.anchor_id.value() == "History");
    TEST_CHECK(c.next_anchor_id.has() && c.next_anchor_id.value() == "Biology");
    TEST_CHECK(c.section_ratio.has() && c.section_ratio.value() == 0.75);
    std::cout << "[TEST] OK\n";
}

void test_cursor_update_minimal() {
    std::cout << "[TEST] cursor_update minimal, unknown cursorType..." << std::endl;
    Recorder rec;
    parser::Router<Recorder> router{rec};

    constexpr std::string_view frame =
        R"({"type":"cursor_update","payload":{"playerId":"p2","playerName":"Bob","x":1,"y":0,"article":"Cat","cursorType":"crosshair","anchorId":null}})";

    TEST_CHECK(router.parse_and_route(frame) == Result::Delivered);
    const auto& c = rec.cursors[0];
    TEST_CHECK(c.x == 1.0);
    TEST_CHECK(!c.cursor_type.has());
    TEST_CHECK(!c.anchor_id.has());
    TEST_CHECK(!c.next_anchor_id.has());
    TEST_CHECK(!c.section_ratio.has());
    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// NEGATIVE CASES
// ------------------------------------------------------------

void test_not_json() {
    std::cout << "[TEST] non-JSON frame..." << std::endl;
    Recorder rec;
    parser::Router<Recorder> router{rec};

    TEST_CHECK(router.parse_and_route("not json at all") == Result::InvalidJson);
    TEST_CHECK(router.parse_and_route(R"({"type":"room_state","payload":)") == Result::InvalidJson);
    TEST_CHECK(rec.order.empty());
    std::cout << "[TEST] OK\n";
}

void test_ignored_types() {
    std::cout << "[TEST] unknown and client-bound types are ignored..." << std::endl;
    Recorder rec;
    parser::Router<Recorder> router{rec};

    TEST_CHECK(router.parse_and_route(R"({"type":"chat","payload":{"text":"hi"}})") == Result::Ignored);
    TEST_CHECK(router.parse_and_route(R"({"type":"navigate","payload":{"article":"Dog"}})") == Result::Ignored);
    TEST_CHECK(rec.order.empty());
    std::cout << "[TEST] OK\n";
}

void test_schema_violations() {
    std::cout << "[TEST] schema violations..." << std::endl;
    Recorder rec;
    parser::Router<Recorder> router{rec};

    // envelope
    TEST_CHECK(router.parse_and_route(R"({"payload":{}})") == Result::InvalidSchema);
    TEST_CHECK(router.parse_and_route(R"({"type":42,"payload":{}})") == Result::InvalidSchema);
    TEST_CHECK(router.parse_and_route(R"({"type":"player_left"})") == Result::InvalidSchema);
    TEST_CHECK(router.parse_and_route(R"({"type":"player_left","payload":[]})") == Result::InvalidSchema);

    // payload fields
    TEST_CHECK(router.parse_and_route(R"({"type":"player_left","payload":{}})") == Result::InvalidSchema);
    TEST_CHECK(router.parse_and_route(R"({"type":"player_update","payload":{"playerId":"p1","currentArticle":"Cat","clicks":"two"}})") == Result::InvalidSchema);
    TEST_CHECK(router.parse_and_route(R"({"type":"cursor_update","payload":{"playerId":"p1","x":0.1,"article":"Cat"}})") == Result::InvalidSchema);
    TEST_CHECK(router.parse_and_route(R"({"type":"room_state","payload":{"id":"R1","players":{},"endArticle":"Dog","started":false}})") == Result::InvalidSchema);
    TEST_CHECK(router.parse_and_route(R"({"type":"error","payload":{"message":"x"}})") == Result::InvalidSchema);

    TEST_CHECK(rec.order.empty());
    std::cout << "[TEST] OK\n";
}

void test_value_violations() {
    std::cout << "[TEST] value violations..." << std::endl;
    Recorder rec;
    parser::Router<Recorder> router{rec};

    // empty id
    TEST_CHECK(router.parse_and_route(R"({"type":"player_left","payload":{"playerId":""}})") == Result::InvalidValue);
    // negative race time
    TEST_CHECK(router.parse_and_route(json::server::player_finish("p1", "Alice", -5, 1)) == Result::InvalidValue);
    // players key disagrees with the embedded id
    constexpr std::string_view mismatched =
        R"({"type":"room_state","payload":{"id":"R1","players":{"p9":{"id":"p1","name":"Alice"}},"startArticle":"Cat","endArticle":"Dog","started":false}})";
    TEST_CHECK(router.parse_and_route(mismatched) == Result::InvalidValue);

    TEST_CHECK(rec.order.empty());
    std::cout << "[TEST] OK\n";
}

void test_router_recovers_after_garbage() {
    std::cout << "[TEST] parser state is reusable after a bad frame..." << std::endl;
    Recorder rec;
    parser::Router<Recorder> router{rec};

    TEST_CHECK(router.parse_and_route("{{{") == Result::InvalidJson);
    TEST_CHECK(router.parse_and_route(json::server::player_left("p2")) == Result::Delivered);
    TEST_CHECK(rec.left.size() == 1);
    std::cout << "[TEST] OK\n";
}

int main() {
    test_room_state();
    test_room_state_without_host();
    test_incremental_messages();
    test_cursor_update_full();
    test_cursor_update_minimal();
    test_not_json();
    test_ignored_types();
    test_schema_violations();
    test_value_violations();
    test_router_recovers_after_garbage();

    std::cout << "\n[ROUTER TESTS PASSED]\n";
    return 0;
}
