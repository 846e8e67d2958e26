#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "relaygate/core/error.hpp"
#include "relaygate/core/http/header.hpp"
#include "lcr/optional.hpp"

namespace relaygate::core::http {

// ------------------------------------------------------------
// Upstream status → outcome
// ------------------------------------------------------------
//   2xx        → None
//   401, 403   → AuthRejected
//   429        → RateLimited
//   5xx        → UpstreamError
//   other      → ClientError (4xx, and anything outside the HTTP range)
[[nodiscard]]
inline constexpr Error classify_status(long status) noexcept {
    if (status >= 200 && status < 300) return Error::None;
    if (status == 401 || status == 403) return Error::AuthRejected;
    if (status == 429)                  return Error::RateLimited;
    if (status >= 500 && status < 600)  return Error::UpstreamError;
    return Error::ClientError;
}

// Retry-After in delta-seconds form. HTTP-date values are not interpreted.
[[nodiscard]]
inline lcr::optional<std::chrono::seconds> parse_retry_after(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r' || value.back() == '\n')) value.remove_suffix(1);
    if (value.empty() || value.size() > 9) {
        return {};
    }
    std::int64_t secs = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return {};
        }
        secs = secs * 10 + (c - '0');
    }
    return std::chrono::seconds{secs};
}

[[nodiscard]]
inline lcr::optional<std::chrono::seconds> retry_after(const HeaderList& headers) noexcept {
    const Header* h = find_header(headers, "retry-after");
    if (!h) {
        return {};
    }
    return parse_retry_after(h->value);
}

} // namespace relaygate::core::http
