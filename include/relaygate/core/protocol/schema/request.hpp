#pragma once

#include <string>
#include <string_view>

#include "relaygate/core/request/built_request.hpp"
#include "relaygate/core/request/logical_request.hpp"
#include "lcr/json.hpp"

namespace relaygate::core::protocol::schema {

// gateway → client
//
// {"type":"request","request_id":"<id>","endpoint":"<name>","params":{...},
//  "http":{"method":"...","url":"...","headers":{...}[,"body":"..."]}}
//
// 'http' is the exact request the client must issue; endpoint and params are
// informational. Non-owning: referenced objects must outlive the view.
struct RequestView {
    std::string_view request_id;
    const request::LogicalRequest& logical;
    const request::BuiltRequest& http;

    void write_json(std::string& out) const {
        out += "{\"type\":\"request\",\"request_id\":";
        lcr::json::append_string(out, request_id);
        out += ",\"endpoint\":";
        lcr::json::append_string(out, logical.endpoint);
        out += ",\"params\":";
        logical.params.write_json(out);
        out += ",\"http\":";
        http.write_json(out);
        out += '}';
    }

    std::string to_json() const {
        std::string out;
        out.reserve(256 + http.url.size() + (http.body.has() ? http.body.value().size() : 0));
        write_json(out);
        return out;
    }
};

} // namespace relaygate::core::protocol::schema
