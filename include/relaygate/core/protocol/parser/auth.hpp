#pragma once

#include <string_view>

#include "relaygate/core/protocol/schema/auth.hpp"
#include "relaygate/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace relaygate::core::protocol::parser {

struct auth {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::Auth& out) noexcept {
        // token (required, non-empty)
        std::string_view token;
        auto r = helper::parse_string_required(root, "token", token);
        if (r != Result::Parsed) {
            RG_DEBUG("[PARSER] Field 'token' missing or invalid in auth message");
            return r;
        }
        if (token.empty()) {
            RG_DEBUG("[PARSER] Empty 'token' in auth message");
            return Result::InvalidValue;
        }
        out.token = std::string(token);
        return Result::Parsed;
    }
};

} // namespace relaygate::core::protocol::parser
