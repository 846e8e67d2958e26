#pragma once

#include <string>
#include <utility>

#include "relaygate/core/error.hpp"

namespace relaygate::core::protocol {

// Resolution of one delegated call as seen by the protocol layer.
//
//   error == None            payload holds the raw JSON "payload" value ("" if absent)
//   error == DelegateFailed  message holds the client's error string
//   anything else            local resolution (Timeout, Disconnected, ...)
struct Reply {
    Error error{Error::None};
    std::string payload;
    std::string message;

    [[nodiscard]]
    inline bool ok() const noexcept { return error == Error::None; }

    [[nodiscard]]
    static inline Reply failure(Error e, std::string msg) {
        Reply r;
        r.error = e;
        r.message = std::move(msg);
        return r;
    }
};

} // namespace relaygate::core::protocol
