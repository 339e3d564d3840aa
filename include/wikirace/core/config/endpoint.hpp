#pragma once

#include <string_view>


namespace wikirace::core::config {

// Fixed game-server endpoint used when nothing else is configured
inline constexpr std::string_view DEFAULT_URL = "ws://localhost:8080/ws";

} // namespace wikirace::core::config
