#pragma once

#include <cstdint>
#include <string>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"

namespace relaygate::core::protocol::schema {

// Pong in either direction.
//   gateway → client : answer to a client ping, carries server_time (ms since epoch)
//   client → gateway : answer to a gateway ping, id echoes the ping id
struct Pong {
    lcr::optional<std::string> id{};
    lcr::optional<std::int64_t> server_time{};

    std::string to_json() const {
        std::string out = "{\"type\":\"pong\"";
        if (id.has()) {
            out += ",\"id\":";
            lcr::json::append_string(out, id.value());
        }
        if (server_time.has()) {
            out += ",\"server_time\":";
            lcr::json::append(out, server_time.value());
        }
        out += '}';
        return out;
    }
};

} // namespace relaygate::core::protocol::schema
