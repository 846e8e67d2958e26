#include "relaygate/core/gateway/envelope.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <simdjson.h>

#include "relaygate/core/http/status.hpp"
#include "relaygate/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

namespace relaygate::core::gateway {

namespace {

using protocol::parser::Result;
namespace helper = protocol::parser::helper;

std::string text_of(const simdjson::dom::element& e) {
    std::string_view sv;
    if (!e.get(sv)) {
        return std::string(sv);
    }
    if (e.is_null()) {
        return {};
    }
    return simdjson::minify(e);
}

Result parse_envelope(const simdjson::dom::element& root, core::Result& out) {
    std::int64_t status = 0;
    if (helper::parse_int64_required(root, "status_code", status) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (status < 100 || status > 999) {
        return Result::InvalidValue;
    }
    out.status_code = static_cast<long>(status);

    simdjson::dom::element headers;
    bool present = false;
    if (helper::parse_element_optional(root, "headers", headers, present) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (present && !headers.is_null()) {
        simdjson::dom::object obj;
        if (headers.get(obj)) {
            return Result::InvalidSchema;
        }
        for (auto field : obj) {
            out.headers.push_back({std::string(field.key), text_of(field.value)});
        }
    }

    simdjson::dom::element body;
    if (helper::parse_element_optional(root, "body", body, present) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (present) {
        out.body = text_of(body);
    }
    return Result::Parsed;
}

} // namespace


core::Result normalize_reply(protocol::Reply reply) {
    if (!reply.ok()) {
        return core::Result::failure(reply.error, std::move(reply.message), Route::Delegated);
    }

    core::Result out;
    out.route = Route::Delegated;

    simdjson::dom::parser parser;
    simdjson::dom::element root;
    const bool looks_like_envelope =
        !reply.payload.empty()
        && !parser.parse(reply.payload.data(), reply.payload.size()).get(root)
        && root.type() == simdjson::dom::element_type::OBJECT
        && !root["status_code"].error();

    if (!looks_like_envelope) {
        out.status_code = 200;
        out.body = std::move(reply.payload);
        return out;
    }

    const auto r = parse_envelope(root, out);
    if (r != Result::Parsed) {
        RG_WARN("[ROUTER] Malformed HTTP envelope in delegated reply (" << protocol::parser::to_string(r) << ")");
        return core::Result::failure(Error::ProtocolError, "malformed HTTP envelope in delegated reply", Route::Delegated);
    }

    out.error = http::classify_status(out.status_code);
    if (out.error == Error::RateLimited) {
        out.retry_after = http::retry_after(out.headers);
    }
    if (!out.ok()) {
        out.message = "upstream responded with HTTP " + std::to_string(out.status_code);
    }
    return out;
}

} // namespace relaygate::core::gateway
