#pragma once

#include <string>
#include <string_view>

#include "relaygate/core/error.hpp"
#include "relaygate/core/credentials/snapshot.hpp"
#include "relaygate/core/request/built_request.hpp"
#include "relaygate/core/request/endpoint.hpp"
#include "relaygate/core/request/logical_request.hpp"
#include "relaygate/core/request/params.hpp"

/*
===============================================================================
Request Template Engine
===============================================================================

Maps a logical call (endpoint + typed parameters) and a credential snapshot
to a fully-formed BuiltRequest. The mapping is pure: no clock, no randomness,
no I/O, no global state. Identical inputs produce byte-identical output,
which is what allows the server and delegated paths to emit the same request.

Shape rules:
  • Query parameters are written in a fixed per-endpoint order, never sorted.
  • Every embedded value is escaped through request::percent_encode().
  • Header order is fixed:
        accept, accept-language, csrf-token, x-restli-protocol-version,
        content-type (requests with a body), cookie
    csrf-token and cookie appear only when the snapshot carries the data.
  • Cookie header lists li_at, JSESSIONID (quoted), liap in that order,
    skipping absent ones.

Failures:
  • Error::UnsupportedEndpoint  unknown endpoint name
  • Error::InvalidParameters    missing / mistyped / out-of-range parameter
  'detail' receives a one-line description in both cases.
===============================================================================
*/

namespace relaygate::core::request {

namespace upstream {
inline constexpr std::string_view VOYAGER_BASE_URL = "https://www.linkedin.com/voyager/api";
inline constexpr std::string_view GRAPHQL_BASE_URL = "https://www.linkedin.com/voyager/api/graphql";

inline constexpr std::string_view ACCEPT           = "application/vnd.linkedin.normalized+json+2.1";
inline constexpr std::string_view ACCEPT_LANGUAGE  = "en-US,en;q=0.9";
inline constexpr std::string_view RESTLI_VERSION   = "2.0.0";
inline constexpr std::string_view JSON_CONTENT     = "application/json";
} // namespace upstream

[[nodiscard]]
Error build(Endpoint endpoint, const Params& params, const credentials::CredentialSnapshot& creds,
            BuiltRequest& out, std::string& detail);

[[nodiscard]]
Error build(std::string_view endpoint, const Params& params, const credentials::CredentialSnapshot& creds,
            BuiltRequest& out, std::string& detail);

[[nodiscard]]
inline Error build(const LogicalRequest& req, const credentials::CredentialSnapshot& creds,
                   BuiltRequest& out, std::string& detail) {
    return build(req.endpoint, req.params, creds, out, detail);
}

// Header block shared by every endpoint. Exposed for the parity checks.
void append_standard_headers(http::HeaderList& headers, const credentials::CredentialSnapshot& creds, bool has_body);

} // namespace relaygate::core::request
