#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "lcr/optional.hpp"

namespace relaygate::core::credentials {

namespace cookie {
inline constexpr std::string_view LI_AT      = "li_at";
inline constexpr std::string_view JSESSIONID = "JSESSIONID";
inline constexpr std::string_view LIAP       = "liap";
} // namespace cookie

/*
===============================================================================
CredentialSnapshot
===============================================================================

Read-only view of the credential subset the gateway holds for one user.
The gateway never mutates a snapshot it received; derived views (see
for_delegation()) are returned by value.

A snapshot may be incomplete. Direct execution needs the csrf token plus
the li_at and JSESSIONID session cookies; anything less is reported as
IncompleteCredentials by the server path before any network I/O.
===============================================================================
*/
struct CredentialSnapshot {
    lcr::optional<std::string> csrf_token{};
    std::map<std::string, std::string, std::less<>> cookies;
    std::chrono::system_clock::time_point captured_at{};

    [[nodiscard]]
    inline const std::string* cookie(std::string_view name) const noexcept {
        auto it = cookies.find(name);
        if (it == cookies.end() || it->second.empty()) {
            return nullptr;
        }
        return &it->second;
    }

    [[nodiscard]]
    inline bool has_csrf() const noexcept {
        return csrf_token.has() && !csrf_token.value().empty();
    }

    [[nodiscard]]
    inline bool is_server_ready() const noexcept {
        return has_csrf()
            && cookie(cookie::LI_AT) != nullptr
            && cookie(cookie::JSESSIONID) != nullptr;
    }

    // The browser jar supplies cookies on the delegated path; only the csrf
    // token travels with the request.
    [[nodiscard]]
    inline CredentialSnapshot for_delegation() const {
        CredentialSnapshot out;
        out.csrf_token = csrf_token;
        out.captured_at = captured_at;
        return out;
    }
};

} // namespace relaygate::core::credentials
