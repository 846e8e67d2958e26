#pragma once

#include <cstdint>
#include <string>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"

namespace relaygate::core::protocol::schema {

namespace error_code {
inline constexpr std::int64_t PROTOCOL_VIOLATION = 4000;
inline constexpr std::int64_t AUTH_FAILED        = 4001;
inline constexpr std::int64_t AUTH_TIMEOUT       = 4002;
} // namespace error_code

// Protocol-level failure report, either direction:
//   {"type":"error","message":"..."[,"code":<int>]}
struct ErrorNotice {
    std::string message;
    lcr::optional<std::int64_t> code{};

    std::string to_json() const {
        std::string out = "{\"type\":\"error\",\"message\":";
        lcr::json::append_string(out, message);
        if (code.has()) {
            out += ",\"code\":";
            lcr::json::append(out, code.value());
        }
        out += '}';
        return out;
    }
};

} // namespace relaygate::core::protocol::schema
