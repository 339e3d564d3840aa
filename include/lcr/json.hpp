#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cmath>
#include <charconv>
#include <system_error>


namespace lcr {
namespace json {

// Appends `s` as a JSON string literal (with surrounding quotes).
// Control characters are emitted as \u00XX; UTF-8 bytes pass through.
inline void append_string(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    out += '"';
    for (char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out += hex[c >> 4];
                    out += hex[c & 0x0F];
                } else {
                    out += ch;
                }
        }
    }
    out += '"';
}

// Fast integer → string formatter
inline void append_uint(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

inline void append_int(std::string& out, std::int64_t value) {
    if (value < 0) {
        out += '-';
        append_uint(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append_uint(out, static_cast<std::uint64_t>(value));
}

// Shortest round-trippable form, always with a '.' decimal point (to_chars
// ignores the global locale). Non-finite values are not valid JSON and become 0.
inline void append_double(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += '0';
        return;
    }
    char buf[32];
    const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        out += '0';
        return;
    }
    out.append(buf, end);
}

inline void append_bool(std::string& out, bool value) {
    out += value ? "true" : "false";
}

} // namespace json
} // namespace lcr
