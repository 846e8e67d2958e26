#pragma once

#include <string>

#include "relaygate/core/protocol/schema/error_notice.hpp"
#include "relaygate/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

namespace relaygate::core::protocol::parser {

struct error_notice {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ErrorNotice& out) noexcept {
        // message (optional, defaults to empty)
        lcr::optional<std::string> message;
        auto r = helper::parse_string_optional(root, "message", message);
        if (r != Result::Parsed) {
            RG_DEBUG("[PARSER] Field 'message' invalid in error message");
            return r;
        }
        out.message = message.has() ? message.value() : std::string();

        // code (optional)
        r = helper::parse_int64_optional(root, "code", out.code);
        if (r != Result::Parsed) {
            RG_DEBUG("[PARSER] Field 'code' invalid in error message");
        }
        return r;
    }
};

} // namespace relaygate::core::protocol::parser
