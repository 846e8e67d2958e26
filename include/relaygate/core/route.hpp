#pragma once

#include <cstdint>
#include <string_view>

namespace relaygate::core {

// Execution path for one logical call. Chosen once per call and never switched.
enum class Route : uint8_t {
    Server,     // direct HTTP from the gateway with the stored credential subset
    Delegated   // forwarded to the user's authenticated browser session
};

[[nodiscard]]
inline constexpr std::string_view to_string(Route r) noexcept {
    switch (r) {
        case Route::Server:    return "server";
        case Route::Delegated: return "delegated";
        default:               return "unknown";
    }
}

[[nodiscard]]
inline constexpr bool parse_route(std::string_view s, Route& out) noexcept {
    if (s == "server")    { out = Route::Server;    return true; }
    if (s == "delegated") { out = Route::Delegated; return true; }
    return false;
}

} // namespace relaygate::core
