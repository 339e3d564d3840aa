#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <ostream>
#include <iostream>
#include <cstdlib>

#include <CLI/CLI.hpp>

#include "cli/validators.hpp"
#include "wikirace/core/config/endpoint.hpp"
#include "lcr/log/logger.hpp"

namespace wikirace::apps::cli {

struct Params {
    std::string url                = std::string(core::config::DEFAULT_URL);
    std::string room               = "R1";
    std::string name               = "player";
    std::string start_article      = "Cat";
    std::string end_article        = "Dog";
    std::vector<std::string> route;           // articles to click through, in order
    unsigned step_ms               = 1500;     // pause between clicks
    bool host                      = false;
    bool rejoin                    = false;
    unsigned duration              = 0;        // seconds, 0 = until results / Ctrl+C
    std::string log_level          = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL       : " << url << "\n"
           << "  Room      : " << room << "\n"
           << "  Name      : " << name << "\n"
           << "  Race      : " << start_article << " -> " << end_article << "\n"
           << "  Route     : ";
        for (const auto& a : route) {
            os << a << " ";
        }
        os << "\n  Host      : " << (host ? "yes" : "no")
           << "\n  Rejoin    : " << (rejoin ? "yes" : "no")
           << "\n  Duration  : " << (duration ? std::to_string(duration) + " s" : std::string("unbounded"))
           << "\n  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.url, "Game server WebSocket endpoint")->check(ws_url_validator)->default_val(params.url);
    app.add_option("-r,--room", params.room, "Room code to join")->check(non_empty_validator)->default_val(params.room);
    app.add_option("-n,--name", params.name, "Display name")->check(non_empty_validator)->default_val(params.name);
    app.add_option("--start", params.start_article, "Start article title")->check(non_empty_validator)->default_val(params.start_article);
    app.add_option("--end", params.end_article, "Target article title")->check(non_empty_validator)->default_val(params.end_article);
    app.add_option("--route", params.route, "Articles to navigate through once the race starts (e.g. --route Animal --route Dog)");
    app.add_option("--step-ms", params.step_ms, "Milliseconds between simulated clicks")->check(CLI::Range(50u, 60000u))->default_val(params.step_ms);
    app.add_flag("--host", params.host, "Start the race as soon as the room is joined");
    app.add_flag("--rejoin", params.rejoin, "Rejoin an existing room instead of joining a new one");
    app.add_option("--duration", params.duration, "Seconds to run before leaving (0 = until results)")->default_val(params.duration);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Headless race participant.\n"
        "Room, race and notification events are printed as they happen."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    lcr::log::Logger::instance().set_level(lcr::log::parse_level(params.log_level));
    return params;
}

} // namespace wikirace::apps::cli
