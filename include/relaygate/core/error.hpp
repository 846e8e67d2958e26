#pragma once

#include <cstdint>
#include <string_view>

/*
===============================================================================
relaygate::core::Error
===============================================================================

Error is the single outcome taxonomy shared by both execution paths.
Every operation that can fail returns one of these values inside a typed
result; none of them is ever thrown across the core API.

Build-time failures (before any I/O):
  - UnsupportedEndpoint   : unknown logical call (programmer error, not retried)
  - InvalidParameters     : required parameter missing or out of range
  - IncompleteCredentials : server path requested without csrf + session cookies

Upstream HTTP classification (server path, and delegated HTTP envelopes):
  - AuthRejected   : 401 / 403
  - RateLimited    : 429 (Retry-After carried when present)
  - UpstreamError  : 5xx (safe to retry with backoff, caller's decision)
  - ClientError    : any other 4xx
  - TransportFailure : request could not be performed or written at all

Delegated path:
  - NoDelegateAvailable : no OPEN connection registered for the user
  - Timeout             : deadline elapsed; the remote call may still complete
  - Disconnected        : connection left OPEN before the call resolved
  - DelegateFailed      : remote executor reported failure
  - ProtocolError       : malformed or unexpected message / envelope

Nothing here is process-fatal. Only a wire-level ProtocolError has a side
effect (the offending connection is torn down).
===============================================================================
*/

namespace relaygate::core {

enum class Error : uint8_t {
    None = 0,

    UnsupportedEndpoint,
    InvalidParameters,
    IncompleteCredentials,

    AuthRejected,
    RateLimited,
    UpstreamError,
    ClientError,
    TransportFailure,

    NoDelegateAvailable,
    Timeout,
    Disconnected,
    DelegateFailed,
    ProtocolError
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:                  return "None";
        case Error::UnsupportedEndpoint:   return "UnsupportedEndpoint";
        case Error::InvalidParameters:     return "InvalidParameters";
        case Error::IncompleteCredentials: return "IncompleteCredentials";
        case Error::AuthRejected:          return "AuthRejected";
        case Error::RateLimited:           return "RateLimited";
        case Error::UpstreamError:         return "UpstreamError";
        case Error::ClientError:           return "ClientError";
        case Error::TransportFailure:      return "TransportFailure";
        case Error::NoDelegateAvailable:   return "NoDelegateAvailable";
        case Error::Timeout:               return "Timeout";
        case Error::Disconnected:          return "Disconnected";
        case Error::DelegateFailed:        return "DelegateFailed";
        case Error::ProtocolError:         return "ProtocolError";
        default:                           return "Unknown";
    }
}

// Upstream conditions a caller may reasonably retry (with backoff).
// Timeout is excluded: the remote call may still be in flight.
[[nodiscard]]
inline constexpr bool is_transient(Error e) noexcept {
    return e == Error::UpstreamError
        || e == Error::RateLimited
        || e == Error::TransportFailure;
}

} // namespace relaygate::core
