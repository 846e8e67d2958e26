#pragma once

#include <string>

#include "lcr/json.hpp"

namespace relaygate::core::protocol::schema {

// client → gateway
//
//   {"type":"response","request_id":"<id>","success":true,"payload":<any JSON>}
//   {"type":"response","request_id":"<id>","success":false,"error":"<text>"}
//
// 'payload' is kept as raw (minified) JSON text; the protocol layer does not
// look inside it.
struct Response {
    std::string request_id;
    bool success{false};
    std::string payload;
    std::string error;

    std::string to_json() const {
        std::string out = "{\"type\":\"response\",\"request_id\":";
        lcr::json::append_string(out, request_id);
        out += ",\"success\":";
        out += success ? "true" : "false";
        if (success) {
            if (!payload.empty()) {
                out += ",\"payload\":";
                out += payload;
            }
        }
        else {
            out += ",\"error\":";
            lcr::json::append_string(out, error);
        }
        out += '}';
        return out;
    }
};

} // namespace relaygate::core::protocol::schema
