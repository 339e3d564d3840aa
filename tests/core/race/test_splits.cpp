/*
===============================================================================
 race time formatting, titles and SplitTracker - Unit Tests
===============================================================================
*/

#include <iostream>
#include <string>

#include "wikirace/core/race/splits.hpp"
#include "wikirace/core/race/title.hpp"
#include "common/test_check.hpp"

using namespace wikirace::core::race;


void test_format_race_time() {
    std::cout << "[TEST] race time m:ss.cc / h:mm:ss.cc\n";
    TEST_CHECK(format_race_time(0) == "0:00.00");
    TEST_CHECK(format_race_time(4200) == "0:04.20");
    TEST_CHECK(format_race_time(61234) == "1:01.23");
    TEST_CHECK(format_race_time(3599999) == "59:59.99");
    TEST_CHECK(format_race_time(3600000) == "1:00:00.00");
    TEST_CHECK(format_race_time(3723450) == "1:02:03.45");
    TEST_CHECK(format_race_time(-5) == "0:00.00");
    std::cout << "[TEST] OK\n";
}

void test_format_split_delta() {
    std::cout << "[TEST] split delta +s.s / +m:ss.s\n";
    TEST_CHECK(format_split_delta(0) == "+0.0");
    TEST_CHECK(format_split_delta(5432) == "+5.4");
    TEST_CHECK(format_split_delta(60000) == "+1:00.0");
    TEST_CHECK(format_split_delta(65432) == "+1:05.4");
    TEST_CHECK(format_split_delta(754000) == "+12:34.0");
    std::cout << "[TEST] OK\n";
}

void test_titles() {
    std::cout << "[TEST] title normalization and display\n";
    TEST_CHECK(same_article("Albert_Einstein", "albert einstein"));
    TEST_CHECK(same_article("  Dog ", "dog"));
    TEST_CHECK(!same_article("Dog", "Dogs"));
    TEST_CHECK(display_title("New_York_City") == "New York City");
    TEST_CHECK(truncated_title("Short") == "Short");
    TEST_CHECK(truncated_title("List_of_things_named_after_Albert_Einstein") == "List of things named afte...");
    std::cout << "[TEST] OK\n";
}

void test_split_tracker() {
    std::cout << "[TEST] split tracker keeps the newest 7 segments\n";
    SplitTracker splits;

    const auto& first = splits.add("Animal", 5000);
    TEST_CHECK(first.name == "Animal");
    TEST_CHECK(first.delta == "+5.0");
    TEST_CHECK(first.cumulative == "0:05.00");
    TEST_CHECK(first.is_current && first.is_ahead);

    const auto& slow = splits.add("Domestic_animal", 75000);
    TEST_CHECK(slow.name == "Domestic animal");
    TEST_CHECK(slow.delta == "+1:10.0");
    TEST_CHECK(!slow.is_ahead);
    TEST_CHECK(!splits.segments().front().is_current);

    for (int i = 0; i < 6; ++i) {
        splits.add("Article_" + std::to_string(i), 80000 + i * 1000);
    }
    TEST_CHECK(splits.count() == 8);
    TEST_CHECK(splits.segments().size() == 7);
    TEST_CHECK(splits.segments().front().name == "Domestic animal");   // oldest evicted
    TEST_CHECK(splits.segments().back().name == "Article 5");
    TEST_CHECK(splits.segments().back().is_current);

    splits.clear();
    TEST_CHECK(splits.segments().empty());
    TEST_CHECK(splits.count() == 0);
    TEST_CHECK(splits.add("Dog", 1000).delta == "+1.0");
    std::cout << "[TEST] OK\n";
}

int main() {
    test_format_race_time();
    test_format_split_delta();
    test_titles();
    test_split_tracker();

    std::cout << "\n[SPLITS TESTS PASSED]\n";
    return 0;
}
