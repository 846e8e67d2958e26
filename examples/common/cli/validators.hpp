#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "relaygate/core/route.hpp"
#include "lcr/log/logger.hpp"


namespace relaygate::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level lvl;
        if (lcr::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "Log level validator"
);


// -------------------------------------------------------------
// Route validator
// -------------------------------------------------------------
inline auto route_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::Route route;
        if (core::parse_route(value, route)) {
            return {};
        }
        return "Route must be 'server' or 'delegated'";
    },
    "Route validator"
);


// -------------------------------------------------------------
// Token mapping validator (TOKEN=USER)
// -------------------------------------------------------------
inline auto token_mapping_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        const auto eq = value.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == value.size()) {
            return "Token mapping must be TOKEN=USER";
        }
        return {};
    },
    "Token mapping validator"
);


// -------------------------------------------------------------
// User route override validator (USER=server|delegated)
// -------------------------------------------------------------
inline auto route_override_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        const auto eq = value.find('=');
        if (eq == std::string::npos || eq == 0) {
            return "Route override must be USER=server or USER=delegated";
        }
        core::Route route;
        if (!core::parse_route(std::string_view(value).substr(eq + 1), route)) {
            return "Route override must be USER=server or USER=delegated";
        }
        return {};
    },
    "Route override validator"
);

} // namespace relaygate::examples::cli
