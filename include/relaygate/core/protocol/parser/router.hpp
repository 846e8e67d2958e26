#pragma once

#include <string_view>
#include <variant>

#include <simdjson.h>

#include "relaygate/core/protocol/message_type.hpp"
#include "relaygate/core/protocol/parser/result.hpp"
#include "relaygate/core/protocol/parser/helpers.hpp"
#include "relaygate/core/protocol/parser/auth.hpp"
#include "relaygate/core/protocol/parser/liveness.hpp"
#include "relaygate/core/protocol/parser/response.hpp"
#include "relaygate/core/protocol/parser/error_notice.hpp"
#include "lcr/log/logger.hpp"


namespace relaygate::core::protocol::parser {

/*
================================================================================
Delegate Channel Parsing Architecture
================================================================================

Three layers, each with a single job:

  1) Router (this file)
       • Parses the raw frame once
       • Dispatches on the "type" discriminator
       • Rejects types that are not legal client → gateway

  2) Message parsers (auth, ping, pong, response, error_notice)
       • Validate required vs optional fields
       • Log actionable diagnostics
       • Populate the typed schema structure

  3) Helpers
       • Structural checks and primitive extraction
       • Never log, never throw

The router performs no field-level parsing and no protocol-state decisions.
Whether an auth is legal *now*, or a response id is known, is the Session's
business.
================================================================================
*/

using Inbound = std::variant<
    std::monostate,
    schema::Auth,
    schema::PingIn,
    schema::Pong,
    schema::Response,
    schema::ErrorNotice
>;

class Router {
public:
    // Parses one inbound frame.
    //
    //   type : set to the discriminator whenever one was read (Unknown otherwise)
    //   out  : populated only on Result::Parsed
    [[nodiscard]]
    inline Result parse(std::string_view raw_msg, MessageType& type, Inbound& out) noexcept {
        type = MessageType::Unknown;
        out = std::monostate{};

        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg.data(), raw_msg.size()).get(root);
        if (error) {
            RG_WARN("[PARSER] JSON parse error: " << error << " in message: " << raw_msg);
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Parsed) {
            RG_WARN("[PARSER] Message is not a JSON object: " << raw_msg);
            return Result::InvalidSchema;
        }

        std::string_view type_sv;
        if (helper::parse_string_required(root, "type", type_sv) != Result::Parsed) {
            RG_WARN("[PARSER] Field 'type' missing or invalid in message: " << raw_msg);
            return Result::InvalidSchema;
        }
        type = to_message_type(type_sv);

        switch (type) {
            case MessageType::Auth:
                return parse_as_<auth, schema::Auth>(root, out);
            case MessageType::Ping:
                return parse_as_<ping, schema::PingIn>(root, out);
            case MessageType::Pong:
                return parse_as_<pong, schema::Pong>(root, out);
            case MessageType::Response:
                return parse_as_<response, schema::Response>(root, out);
            case MessageType::Error:
                return parse_as_<error_notice, schema::ErrorNotice>(root, out);
            case MessageType::Unknown:
                RG_WARN("[PARSER] Unknown message type '" << type_sv << "'");
                return Result::InvalidSchema;
            default:
                RG_WARN("[PARSER] Message type '" << type_sv << "' is not accepted from clients");
                return Result::InvalidValue;
        }
    }

private:
    simdjson::dom::parser parser_;

private:
    template<class MessageParser, class Schema>
    [[nodiscard]]
    inline Result parse_as_(const simdjson::dom::element& root, Inbound& out) noexcept {
        Schema msg{};
        auto r = MessageParser::parse(root, msg);
        if (r == Result::Parsed) {
            out = std::move(msg);
        }
        return r;
    }
};

} // namespace relaygate::core::protocol::parser
