/*
===============================================================================
 transport::parse_url - Unit Tests
===============================================================================
Accepted shapes, default ports, path and query handling, and rejection of
malformed endpoints. parse_url never throws.
===============================================================================
*/

#include <iostream>
#include <string>

#include "wikirace/core/transport/parse_url.hpp"
#include "common/test_check.hpp"

using namespace wikirace::core::transport;


void test_plain_endpoint() {
    std::cout << "[TEST] ws:// endpoint with explicit port\n";
    ParsedUrl url;
    TEST_CHECK(parse_url("ws://localhost:8080/ws", url) == Error::None);
    TEST_CHECK(!url.secure);
    TEST_CHECK(url.host == "localhost");
    TEST_CHECK(url.port == "8080");
    TEST_CHECK(url.path == "/ws");
    std::cout << "[TEST] OK\n";
}

void test_default_ports_and_path() {
    std::cout << "[TEST] Default ports and root path\n";
    ParsedUrl url;
    TEST_CHECK(parse_url("ws://race.example.org", url) == Error::None);
    TEST_CHECK(url.port == "80");
    TEST_CHECK(url.path == "/");

    TEST_CHECK(parse_url("wss://race.example.org/ws", url) == Error::None);
    TEST_CHECK(url.secure);
    TEST_CHECK(url.port == "443");
    std::cout << "[TEST] OK\n";
}

void test_query_is_kept() {
    std::cout << "[TEST] Query string travels with the path\n";
    ParsedUrl url;
    TEST_CHECK(parse_url("ws://host:9000?room=R1", url) == Error::None);
    TEST_CHECK(url.host == "host");
    TEST_CHECK(url.path == "/?room=R1");
    TEST_CHECK(parse_url("ws://host/ws?room=R1", url) == Error::None);
    TEST_CHECK(url.path == "/ws?room=R1");
    std::cout << "[TEST] OK\n";
}

void test_rejections() {
    std::cout << "[TEST] Malformed endpoints are rejected\n";
    ParsedUrl url;
    TEST_CHECK(parse_url("http://localhost:8080/ws", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://:8080/ws", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host:/ws", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host:80a/ws", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host:0/ws", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host:70000/ws", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("", url) == Error::InvalidUrl);
    std::cout << "[TEST] OK\n";
}

int main() {
    test_plain_endpoint();
    test_default_ports_and_path();
    test_query_is_kept();
    test_rejections();

    std::cout << "\n[PARSE URL TESTS PASSED]\n";
    return 0;
}
