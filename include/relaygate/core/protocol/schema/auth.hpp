#pragma once

#include <string>

#include "relaygate/core/user_id.hpp"
#include "lcr/json.hpp"

namespace relaygate::core::protocol::schema {

// client → gateway: {"type":"auth","token":"..."}
struct Auth {
    std::string token;

    std::string to_json() const {
        std::string out = "{\"type\":\"auth\",\"token\":";
        lcr::json::append_string(out, token);
        out += '}';
        return out;
    }
};

// gateway → client: {"type":"auth_success","user_id":"..."}
struct AuthSuccess {
    UserId user_id;

    std::string to_json() const {
        std::string out = "{\"type\":\"auth_success\",\"user_id\":";
        lcr::json::append_string(out, user_id);
        out += '}';
        return out;
    }
};

} // namespace relaygate::core::protocol::schema
