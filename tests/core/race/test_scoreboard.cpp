/*
===============================================================================
 race::build_scoreboard - Unit Tests
===============================================================================
*/

#include <iostream>
#include <string>

#include "wikirace/core/race/scoreboard.hpp"
#include "common/test_check.hpp"

using namespace wikirace::core;


static void add(protocol::schema::RoomState& room, const std::string& id, const std::string& name, std::uint64_t clicks, bool finished = false) {
    protocol::schema::Player p;
    p.id = id;
    p.name = name;
    p.clicks = clicks;
    p.finished = finished;
    room.players.emplace(id, p);
}


void test_rows_sorted_by_clicks() {
    std::cout << "[TEST] rows sorted by clicks, ties in id order\n";
    protocol::schema::RoomState room;
    add(room, "p3", "Cara", 3);
    add(room, "p1", "Alice", 5, true);
    add(room, "p2", "Bob", 3);

    const auto rows = race::build_scoreboard(room, 3);
    TEST_CHECK(rows.size() == 3);

    TEST_CHECK(rows[0].player_id == "p1");
    TEST_CHECK(rows[0].diff == "+2");
    TEST_CHECK(rows[0].standing == race::Standing::Ahead);
    TEST_CHECK(rows[0].finished);

    TEST_CHECK(rows[1].player_id == "p2");
    TEST_CHECK(rows[1].diff == "0");
    TEST_CHECK(rows[1].standing == race::Standing::Neutral);
    TEST_CHECK(rows[2].player_id == "p3");

    TEST_CHECK(rows[0].color == notify::player_color("Alice"));
    std::cout << "[TEST] OK\n";
}

void test_behind_diff() {
    std::cout << "[TEST] fewer clicks than the local player\n";
    protocol::schema::RoomState room;
    add(room, "p1", "Alice", 1);
    const auto rows = race::build_scoreboard(room, 4);
    TEST_CHECK(rows[0].diff == "-3");
    TEST_CHECK(rows[0].standing == race::Standing::Behind);

    TEST_CHECK(race::build_scoreboard(protocol::schema::RoomState{}, 0).empty());
    std::cout << "[TEST] OK\n";
}

int main() {
    test_rows_sorted_by_clicks();
    test_behind_diff();

    std::cout << "\n[SCOREBOARD TESTS PASSED]\n";
    return 0;
}
