#include <atomic>
#include <csignal>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <thread>

#include "wikirace/core.hpp"
using namespace wikirace::core;
namespace schema = wikirace::core::protocol::schema;

#include "cli/params.hpp"
namespace cli = wikirace::apps::cli;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // Signal handling
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    const auto params = cli::configure(argc, argv, "wikirace - headless race participant\n"
        "Joins a room, optionally starts the race and clicks through a fixed route of articles.\n"
    );
    params.dump("=== Race Client Parameters ===", std::cout);

    // -------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------
    Client client;

    bool joined = false;
    bool start_requested = false;
    bool racing = false;
    bool done = false;
    Clock::time_point next_click{};
    std::size_t route_index = 0;

    // Join (or rejoin) as soon as the connection is up
    client.on_connection([&](transport::connection::Signal sig) {
        WR_INFO(" -> connection " << transport::connection::to_string(sig));
        if (sig == transport::connection::Signal::Connected && !joined) {
            joined = params.rejoin
                ? client.rejoin_room(params.room, params.name)
                : client.join_room(params.room, params.name, params.start_article, params.end_article);
        }
        if (sig == transport::connection::Signal::Disconnected) {
            done = true;
        }
    });

    client.on_race_started([&](const schema::RaceStarted& msg) {
        std::cout << " -> race started: " << race::truncated_title(msg.start_article)
                  << " -> " << race::truncated_title(msg.end_article) << std::endl;
        const auto now = Clock::now();
        client.on_article_loaded(now);
        racing = true;
        next_click = now + std::chrono::milliseconds(params.step_ms);
    });

    client.on_player_finish([&](const schema::PlayerFinish& msg) {
        std::cout << " -> " << msg.player_name << " finished in " << race::format_race_time(msg.time)
                  << " (" << msg.clicks << " clicks)" << std::endl;
    });

    client.on_notification([&](const notify::Notification& n) {
        WR_INFO(" -> " << n);
    });

    client.on_error([&](std::string_view error) {
        WR_WARN(" -> server error: " << error);
    });

    client.on_results([&](const Results& r) {
        std::cout << "=== Results ===\n";
        if (r.finished && r.time_ms.has()) {
            std::cout << "  Finished in " << race::format_race_time(r.time_ms.value()) << "\n";
        } else {
            std::cout << "  Did not finish\n";
        }
        std::cout << "  Clicks: " << r.clicks << "\n  Path  : " << client.start_article();
        for (const auto& a : r.path) {
            std::cout << " > " << race::display_title(a);
        }
        std::cout << "\n";
        for (const auto& row : r.standings) {
            std::cout << "  " << row.name << "  " << row.clicks << " clicks  " << row.diff
                      << (row.finished ? "  (finished)" : "") << "\n";
        }
        for (const auto& seg : client.splits().segments()) {
            std::cout << "  split " << seg.name << "  " << seg.delta << "  " << seg.cumulative << "\n";
        }
        done = true;
    });

    // Connect
    if (client.connect(params.url) != transport::Error::None) {
        return -1;
    }

    // -------------------------------------------------------------------------
    // Main polling loop (runs until results, duration elapsed or Ctrl+C)
    // -------------------------------------------------------------------------
    const auto started_at = Clock::now();
    while (running.load() && !done) {
        const auto now = Clock::now();
        client.poll(now);   // REQUIRED to process incoming messages

        if (params.host && !start_requested && client.is_host()) {
            start_requested = client.start_race();
        }

        if (racing && route_index < params.route.size() && now >= next_click) {
            client.navigate(params.route[route_index++], now);
            next_click = now + std::chrono::milliseconds(params.step_ms);
        }

        if (params.duration && now - started_at >= std::chrono::seconds(params.duration)) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // -------------------------------------------------------------------------
    // Leave the room and close
    // -------------------------------------------------------------------------
    client.disconnect(true);

    // Drain events before exit
    for (int i = 0; i < 20; ++i) {
        client.poll(Clock::now());
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::cout << "=== Done ===\n";
    return 0;
}
