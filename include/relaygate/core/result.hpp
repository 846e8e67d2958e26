#pragma once

#include <chrono>
#include <string>

#include "relaygate/core/error.hpp"
#include "relaygate/core/route.hpp"
#include "relaygate/core/http/header.hpp"
#include "lcr/optional.hpp"

namespace relaygate::core {

// ===============================================================
// Normalized outcome of one logical call
// ===============================================================
//
// Both execution paths resolve into this shape. On success 'status_code',
// 'headers' and 'body' carry the upstream response as seen by whichever
// path executed it. On failure 'error' is set and 'message' holds a short
// human-readable reason; upstream classifications (AuthRejected, ...) still
// carry the status code and body.
struct Result {
    Error error{Error::None};
    Route route{Route::Server};

    long status_code{0};
    http::HeaderList headers;
    std::string body;

    std::string message;
    lcr::optional<std::chrono::seconds> retry_after{};

    [[nodiscard]]
    inline bool ok() const noexcept { return error == Error::None; }

    [[nodiscard]]
    static inline Result failure(Error e, std::string msg, Route route = Route::Server) {
        Result r;
        r.error = e;
        r.route = route;
        r.message = std::move(msg);
        return r;
    }
};

} // namespace relaygate::core
