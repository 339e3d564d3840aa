#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "wikirace/core/transport/error.hpp"


namespace wikirace::core::transport {

    struct ParsedUrl {
        bool secure{false};   // true = wss, false = ws
        std::string host;
        std::string port;
        std::string path;
    };


    // ---------------------------------------------------------------------
    // Minimal URL parser supporting ws:// and wss://
    //
    // Accepts the endpoint shapes used by game servers and rejects malformed
    // inputs without attempting full RFC compliance. Query strings are kept
    // as part of the path.
    //
    // Example inputs:
    //   ws://localhost:8080/ws
    //   wss://race.example.org/ws?room=R1
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(const std::string& url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.compare(0, ws.size(), ws) == 0) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.compare(0, wss.size(), wss) == 0) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // host[:port] ends at the first '/' or '?'
        const std::size_t end = url.find_first_of("/?", pos);
        const std::string hostport = (end == std::string::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        const std::size_t colon = hostport.rfind(':');
        if (colon != std::string::npos) {
            out.host = hostport.substr(0, colon);
            out.port = hostport.substr(colon + 1);
        } else {
            out.host = hostport;
            out.port = out.secure ? "443" : "80";
        }
        if (end == std::string::npos) {
            out.path = "/";
        } else if (url[end] == '?') {
            out.path = "/" + url.substr(end);
        } else {
            out.path = url.substr(end);
        }

        // Invariants check --------------------------------
        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        return Error::None;
    }

} // namespace wikirace::core::transport
