#pragma once

#include <string>

#include "relaygate/core/http/header.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"

namespace relaygate::core::request {

// ===============================================================
// Fully-formed outbound request
// ===============================================================
//
// Output of the template engine and the unit both execution paths consume.
// Equality is byte-wise over every field, header order included.
struct BuiltRequest {
    std::string method;
    std::string url;
    http::HeaderList headers;
    lcr::optional<std::string> body{};

    [[nodiscard]]
    bool operator==(const BuiltRequest&) const = default;

    // HTTP envelope handed to the remote executor:
    // {"method":"GET","url":"...","headers":{"name":"value",...}[,"body":"..."]}
    void write_json(std::string& out) const {
        out += "{\"method\":";
        lcr::json::append_string(out, method);
        out += ",\"url\":";
        lcr::json::append_string(out, url);
        out += ",\"headers\":{";
        bool first = true;
        for (const auto& h : headers) {
            if (!first) out += ',';
            first = false;
            lcr::json::append_string(out, h.name);
            out += ':';
            lcr::json::append_string(out, h.value);
        }
        out += '}';
        if (body.has()) {
            out += ",\"body\":";
            lcr::json::append_string(out, body.value());
        }
        out += '}';
    }
};

} // namespace relaygate::core::request
