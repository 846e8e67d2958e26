#pragma once

#include <string>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"

namespace relaygate::core::protocol::schema {

// gateway → client, fire-and-forget
//   {"type":"notification"[,"title":"..."],"message":"...","level":"info"}
struct Notification {
    lcr::optional<std::string> title{};
    std::string message;
    std::string level{"info"};

    std::string to_json() const {
        std::string out = "{\"type\":\"notification\"";
        if (title.has()) {
            out += ",\"title\":";
            lcr::json::append_string(out, title.value());
        }
        out += ",\"message\":";
        lcr::json::append_string(out, message);
        out += ",\"level\":";
        lcr::json::append_string(out, level);
        out += '}';
        return out;
    }
};

} // namespace relaygate::core::protocol::schema
