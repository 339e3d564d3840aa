/*
================================================================================
Client → Server Requests - Unit Tests
================================================================================
make_frame() wraps each request in {"type":...,"payload":...}. Optional
cursor members are omitted when absent; strings are JSON-escaped.
Numbers always use '.' as decimal point, whatever the process locale.
================================================================================
*/

#include <clocale>
#include <iostream>
#include <string>

#include "wikirace/core/protocol/json_writable.hpp"
#include "wikirace/core/protocol/schema/requests.hpp"
#include "common/test_check.hpp"

using namespace wikirace::core::protocol;


void test_join_room() {
    std::cout << "[TEST] join_room frame..." << std::endl;
    const auto frame = make_frame(schema::JoinRoom{"R1", "Alice", "Cat", "Dog"});
    TEST_CHECK(frame ==
        R"({"type":"join_room","payload":{"roomId":"R1","playerName":"Alice","startArticle":"Cat","endArticle":"Dog"}})");
    std::cout << "[TEST] OK\n";
}

void test_control_requests() {
    std::cout << "[TEST] payload-less and small requests..." << std::endl;
    TEST_CHECK(make_frame(schema::LeaveRoom{}) == R"({"type":"leave_room","payload":{}})");
    TEST_CHECK(make_frame(schema::StartRace{}) == R"({"type":"start_race","payload":{}})");
    TEST_CHECK(make_frame(schema::RejoinRoom{"R1", "Bob"}) ==
        R"({"type":"rejoin_room","payload":{"roomId":"R1","playerName":"Bob"}})");
    TEST_CHECK(make_frame(schema::Navigate{"Albert_Einstein"}) ==
        R"({"type":"navigate","payload":{"article":"Albert_Einstein"}})");
    TEST_CHECK(make_frame(schema::Finish{4200}) == R"({"type":"finish","payload":{"time":4200}})");
    TEST_CHECK(make_frame(schema::UpdateRoom{"Cat", "Moon"}) ==
        R"({"type":"update_room","payload":{"startArticle":"Cat","endArticle":"Moon"}})");
    std::cout << "[TEST] OK\n";
}

void test_cursor_optional_members() {
    std::cout << "[TEST] cursor frame omits absent members..." << std::endl;
    schema::Cursor c;
    c.x = 0.5;
    c.y = 0.25;
    c.article = "Cat";
    TEST_CHECK(make_frame(c) == R"({"type":"cursor","payload":{"x":0.5,"y":0.25,"article":"Cat"}})");

    c.cursor_type = CursorType::Text;
    c.anchor_id = std::string("History");
    c.section_ratio = 0.75;
    TEST_CHECK(make_frame(c) ==
        R"({"type":"cursor","payload":{"x":0.5,"y":0.25,"article":"Cat","cursorType":"text","anchorId":"History","sectionRatio":0.75}})");

    // Unknown affordance never reaches the wire
    c.cursor_type = CursorType::Unknown;
    c.anchor_id.reset();
    c.section_ratio.reset();
    c.next_anchor_id = std::string("Biology");
    TEST_CHECK(make_frame(c) ==
        R"({"type":"cursor","payload":{"x":0.5,"y":0.25,"article":"Cat","nextAnchorId":"Biology"}})");
    std::cout << "[TEST] OK\n";
}

void test_string_escaping() {
    std::cout << "[TEST] strings are escaped..." << std::endl;
    const auto frame = make_frame(schema::JoinRoom{"R\"1", "A\\li\nce", "Caf\xC3\xA9", "Dog"});
    TEST_CHECK(frame ==
        "{\"type\":\"join_room\",\"payload\":{\"roomId\":\"R\\\"1\",\"playerName\":\"A\\\\li\\nce\","
        "\"startArticle\":\"Caf\xC3\xA9\",\"endArticle\":\"Dog\"}}");
    std::cout << "[TEST] OK\n";
}

void test_numbers_ignore_locale() {
    std::cout << "[TEST] cursor numbers under a comma-decimal locale..." << std::endl;
    const char* previous = std::setlocale(LC_NUMERIC, nullptr);
    const std::string saved = previous ? previous : "C";

    bool switched = false;
    for (const char* name : {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8", "de_DE", "fr_FR"}) {
        if (std::setlocale(LC_NUMERIC, name) != nullptr) {
            switched = true;
            break;
        }
    }
    std::cout << "  comma locale " << (switched ? "active" : "unavailable, checking in C locale") << std::endl;

    schema::Cursor c;
    c.x = 0.52;
    c.y = 0.125;
    c.article = "Cat";
    c.section_ratio = 1e-7;
    const auto frame = make_frame(c);

    std::setlocale(LC_NUMERIC, saved.c_str());

    TEST_CHECK(frame.find(',', frame.find("\"x\":")) == frame.find(",\"y\""));
    TEST_CHECK(frame.find(R"("x":0.52,)") != std::string::npos);
    TEST_CHECK(frame.find(R"("y":0.125,)") != std::string::npos);
    TEST_CHECK(frame.find(R"("sectionRatio":1e-07})") != std::string::npos);
    std::cout << "[TEST] OK\n";
}

int main() {
    test_join_room();
    test_control_requests();
    test_cursor_optional_members();
    test_string_escaping();
    test_numbers_ignore_locale();

    std::cout << "\n[REQUEST SCHEMA TESTS PASSED]\n";
    return 0;
}
