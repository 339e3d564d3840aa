/*
===============================================================================
 notify colors - Unit Tests
===============================================================================
Player colors are a pure function of the display name, identical on every
client: a 32-bit wrapping hash over UTF-16 code units picks a palette slot.
===============================================================================
*/

#include <iostream>

#include "wikirace/core/notify/color.hpp"
#include "common/test_check.hpp"

using namespace wikirace::core::notify;


void test_name_hash() {
    std::cout << "[TEST] name hash\n";
    TEST_CHECK(name_hash("") == 0);
    TEST_CHECK(name_hash("a") == 97);
    TEST_CHECK(name_hash("ab") == 3105);
    TEST_CHECK(name_hash("Bob") == 66965);
    TEST_CHECK(name_hash("\xC3\xA9") == 233);                  // U+00E9, one code unit
    TEST_CHECK(name_hash("\xF0\x9F\x98\x80") == 1772899);      // U+1F600, surrogate pair
    TEST_CHECK(name_hash("polygenelubricants") == -2147483647 - 1);   // wraps to INT32_MIN
    std::cout << "[TEST] OK\n";
}

void test_palette_index() {
    std::cout << "[TEST] palette slot\n";
    TEST_CHECK(palette_index("") == 0);
    TEST_CHECK(palette_index("a") == 1);
    TEST_CHECK(palette_index("Alice") == 0);
    TEST_CHECK(palette_index("Bob") == 5);
    TEST_CHECK(palette_index("\xF0\x9F\x98\x80") == 3);
    TEST_CHECK(palette_index("polygenelubricants") == 0);
    TEST_CHECK(player_color("Bob") == PALETTE[5]);
    TEST_CHECK(player_color("Bob") == player_color("Bob"));
    std::cout << "[TEST] OK\n";
}

void test_tints_and_css() {
    std::cout << "[TEST] tints and css\n";
    TEST_CHECK(PALETTE[0].to_css() == "rgb(255, 71, 87)");
    TEST_CHECK(PALETTE[3].tinted(0.0) == PALETTE[3]);
    TEST_CHECK((PALETTE[3].tinted(1.0) == Rgb{255, 255, 255}));
    TEST_CHECK((letter_color(Rgb{0, 0, 0}) == Rgb{204, 204, 204}));
    TEST_CHECK((border_color(Rgb{0, 0, 0}) == Rgb{76, 76, 76}));
    std::cout << "[TEST] OK\n";
}

int main() {
    test_name_hash();
    test_palette_index();
    test_tints_and_css();

    std::cout << "\n[COLOR TESTS PASSED]\n";
    return 0;
}
