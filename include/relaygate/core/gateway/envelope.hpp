#pragma once

#include "relaygate/core/result.hpp"
#include "relaygate/core/protocol/reply.hpp"


namespace relaygate::core::gateway {

// Normalizes a delegated reply into the common Result shape.
//
//   success, payload {"status_code":<int>, "headers":{...}, "body":<any>}
//       → status classified exactly as on the server path; headers copied;
//         a string body is taken as text, any other body as minified JSON
//   success, any other payload
//       → passed through verbatim as the body, status 200
//   failure
//       → reply error carried over (DelegateFailed, Timeout, ...)
//
// A payload that claims the envelope shape but breaks it (status_code not an
// integer, non-object headers) is ProtocolError.
[[nodiscard]]
Result normalize_reply(protocol::Reply reply);

} // namespace relaygate::core::gateway
