// ============================================================================
// JsonWritable
// ----------------------------------------------------------------------------
//
// Contract for client → server payload types.
//
//   • static constexpr MessageType type   → envelope "type" value
//   • void write_json(std::string&) const → appends the payload OBJECT only
//
// The envelope {"type":...,"payload":...} is written by make_frame(), so a
// payload type can never disagree with the type tag it travels under.
//
// ============================================================================
#pragma once

#include <concepts>
#include <string>

#include "wikirace/core/protocol/message_type.hpp"
#include "lcr/json.hpp"

namespace wikirace::core::protocol {

template<typename T>
concept JsonWritable =
    requires(const T& t, std::string& out) {
        { T::type } -> std::convertible_to<MessageType>;
        { t.write_json(out) } -> std::same_as<void>;
    };

template<JsonWritable T>
[[nodiscard]]
inline std::string make_frame(const T& msg) {
    std::string out;
    out.reserve(96);
    out += "{\"type\":";
    lcr::json::append_string(out, to_string(T::type));
    out += ",\"payload\":";
    msg.write_json(out);
    out += '}';
    return out;
}

} // namespace wikirace::core::protocol
