/*
===============================================================================
 room::Store - Unit Tests
===============================================================================
The store mirrors the server's room by reducing inbound messages. Identity
is the player id; finishing is idempotent; nothing patches a room that was
never snapshotted.
===============================================================================
*/

#include <iostream>
#include <string>

#include "wikirace/core/room/store.hpp"
#include "common/test_check.hpp"

using namespace wikirace::core;
using namespace wikirace::core::protocol;


static schema::Player make_player(const std::string& id, const std::string& name, const std::string& article, std::uint64_t clicks = 0) {
    schema::Player p;
    p.id = id;
    p.name = name;
    p.current_article = article;
    p.clicks = clicks;
    return p;
}

static schema::RoomState make_room() {
    schema::RoomState room;
    room.id = "R1";
    room.start_article = "Cat";
    room.end_article = "Dog";
    room.host_id = "p1";
    room.players.emplace("p1", make_player("p1", "Alice", "Cat"));
    room.players.emplace("p2", make_player("p2", "Bob", "Cat"));
    return room;
}


void test_messages_before_snapshot_are_dropped() {
    std::cout << "[TEST] incremental messages before room_state are dropped\n";
    room::Store store;

    store.apply(make_player("p1", "Alice", "Cat"));
    store.apply(schema::PlayerUpdate{"p1", "Dog", 1});
    store.apply(schema::RaceStarted{"Cat", "Dog"});

    TEST_CHECK(!store.has_room());
    TEST_CHECK(store.find("p1") == nullptr);
    TEST_CHECK(store.version() == 0);
    std::cout << "[TEST] OK\n";
}

void test_snapshot_replaces() {
    std::cout << "[TEST] room_state replaces the mirror\n";
    room::Store store;
    store.apply(make_room());
    TEST_CHECK(store.has_room());
    TEST_CHECK(store.room().players.size() == 2);
    TEST_CHECK(store.host_id() == "p1");
    TEST_CHECK(!store.started());

    schema::RoomState smaller = make_room();
    smaller.players.erase("p2");
    store.apply(smaller);
    TEST_CHECK(store.room() == smaller);
    TEST_CHECK(store.find("p2") == nullptr);
    std::cout << "[TEST] OK\n";
}

void test_join_and_leave_by_id() {
    std::cout << "[TEST] join / leave keyed by id\n";
    room::Store store;
    store.apply(make_room());

    store.apply(make_player("p3", "Cara", "Cat"));
    TEST_CHECK(store.room().players.size() == 3);

    // Same id again replaces in place, no duplicate
    store.apply(make_player("p3", "Cara", "Animal", 2));
    TEST_CHECK(store.room().players.size() == 3);
    TEST_CHECK(store.find("p3")->current_article == "Animal");

    // A second "Bob" is a different player
    store.apply(make_player("p4", "Bob", "Cat"));
    TEST_CHECK(store.room().players.size() == 4);

    store.apply(schema::PlayerLeft{"p2"});
    TEST_CHECK(store.find("p2") == nullptr);
    TEST_CHECK(store.find("p4") != nullptr);
    TEST_CHECK(store.find_by_name("Bob")->id == "p4");

    // Unknown id: no-op
    const auto v = store.version();
    store.apply(schema::PlayerLeft{"p9"});
    TEST_CHECK(store.version() == v);
    TEST_CHECK(store.room().players.size() == 3);
    std::cout << "[TEST] OK\n";
}

void test_update_patches_article_and_clicks() {
    std::cout << "[TEST] player_update patches one player\n";
    room::Store store;
    auto room = make_room();
    room.players["p2"].path = {"Animal"};
    store.apply(room);

    store.apply(schema::PlayerUpdate{"p2", "Mammal", 2});
    const auto* bob = store.find("p2");
    TEST_CHECK(bob->current_article == "Mammal");
    TEST_CHECK(bob->clicks == 2);
    TEST_CHECK(bob->path.size() == 1);     // path is untouched
    TEST_CHECK(store.find("p1")->clicks == 0);
    std::cout << "[TEST] OK\n";
}

void test_finish_is_idempotent() {
    std::cout << "[TEST] player_finish is idempotent\n";
    room::Store store;
    store.apply(make_room());

    store.apply(schema::PlayerFinish{"p1", "Alice", 4200, 1, {"Dog"}});
    const auto* alice = store.find("p1");
    TEST_CHECK(alice->finished);
    TEST_CHECK(alice->finish_time.has() && alice->finish_time.value() == 4200);
    TEST_CHECK(alice->clicks == 1);
    TEST_CHECK(alice->path.size() == 1 && alice->path[0] == "Dog");

    // Repeated finish never moves finishTime
    store.apply(schema::PlayerFinish{"p1", "Alice", 9999, 1, {}});
    TEST_CHECK(alice->finish_time.value() == 4200);
    TEST_CHECK(alice->path.size() == 1);
    std::cout << "[TEST] OK\n";
}

void test_race_started() {
    std::cout << "[TEST] race_started\n";
    room::Store store;
    store.apply(make_room());
    store.apply(schema::RaceStarted{"", "Moon"});
    TEST_CHECK(store.started());
    TEST_CHECK(store.room().start_article == "Cat");   // empty keeps the current value
    TEST_CHECK(store.room().end_article == "Moon");
    std::cout << "[TEST] OK\n";
}

void test_error_leaves_room_untouched() {
    std::cout << "[TEST] error notice\n";
    room::Store store;
    store.apply(make_room());
    const auto before = store.room();
    const auto v = store.version();

    store.apply(schema::ErrorNotice{"Race already started"});
    TEST_CHECK(store.last_error() == "Race already started");
    TEST_CHECK(store.room() == before);
    TEST_CHECK(store.version() == v);

    store.clear_error();
    TEST_CHECK(store.last_error().empty());

    store.clear();
    TEST_CHECK(!store.has_room());
    TEST_CHECK(store.room().players.empty());
    std::cout << "[TEST] OK\n";
}

int main() {
    test_messages_before_snapshot_are_dropped();
    test_snapshot_replaces();
    test_join_and_leave_by_id();
    test_update_patches_article_and_clicks();
    test_finish_is_idempotent();
    test_race_started();
    test_error_leaves_room_untouched();

    std::cout << "\n[ROOM STORE TESTS PASSED]\n";
    return 0;
}
