#pragma once

#include <string>

#include "relaygate/core/protocol/schema/response.hpp"
#include "relaygate/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

namespace relaygate::core::protocol::parser {

struct response {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::Response& out) noexcept {
        // request_id (required, string or integer, non-empty)
        lcr::optional<std::string> id;
        auto r = helper::parse_id_optional(root, "request_id", id);
        if (r != Result::Parsed || !id.has() || id.value().empty()) {
            RG_DEBUG("[PARSER] Field 'request_id' missing or invalid in response message");
            return Result::InvalidSchema;
        }
        out.request_id = std::move(id.value());

        // success (required)
        r = helper::parse_bool_required(root, "success", out.success);
        if (r != Result::Parsed) {
            RG_DEBUG("[PARSER] Field 'success' missing or invalid in response message");
            return r;
        }

        // SUCCESS CASE: payload (optional, any JSON value, kept raw)
        if (out.success) {
            simdjson::dom::element payload;
            bool present = false;
            r = helper::parse_element_optional(root, "payload", payload, present);
            if (r != Result::Parsed) {
                return r;
            }
            out.payload = present ? simdjson::minify(payload) : std::string();
            out.error.clear();
        }
        // FAILURE CASE: error (optional string)
        else {
            lcr::optional<std::string> error;
            r = helper::parse_string_optional(root, "error", error);
            if (r != Result::Parsed) {
                RG_DEBUG("[PARSER] Field 'error' invalid in failed response message");
                return r;
            }
            out.error = error.has() ? error.value() : std::string("delegate reported failure");
            out.payload.clear();
        }
        return Result::Parsed;
    }
};

} // namespace relaygate::core::protocol::parser
