#pragma once

#include "relaygate/core/protocol/schema/ping.hpp"
#include "relaygate/core/protocol/schema/pong.hpp"
#include "relaygate/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace relaygate::core::protocol::parser {

struct ping {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::PingIn& out) noexcept {
        // id (optional, string or integer)
        auto r = helper::parse_id_optional(root, "id", out.id);
        if (r != Result::Parsed) {
            RG_DEBUG("[PARSER] Field 'id' invalid in ping message");
        }
        return r;
    }
};

struct pong {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::Pong& out) noexcept {
        // id (optional, string or integer)
        auto r = helper::parse_id_optional(root, "id", out.id);
        if (r != Result::Parsed) {
            RG_DEBUG("[PARSER] Field 'id' invalid in pong message");
            return r;
        }
        // server_time (optional)
        r = helper::parse_int64_optional(root, "server_time", out.server_time);
        if (r != Result::Parsed) {
            RG_DEBUG("[PARSER] Field 'server_time' invalid in pong message");
        }
        return r;
    }
};

} // namespace relaygate::core::protocol::parser
