#pragma once

#include <chrono>

#include "relaygate/core/route.hpp"


namespace relaygate::core::config {

/*
===============================================================================
Gateway timing and routing defaults
===============================================================================

  ping_interval         gateway → client ping cadence
  liveness_window       connection is dropped when no pong arrives within it
  auth_timeout          connection is dropped when no auth arrives within it
  default_call_timeout  delegated call deadline when the caller passes none
  upstream_timeout      total HTTP budget on the server path
  default_route         route for users without an override

liveness_window must be larger than ping_interval, otherwise a healthy client
is dropped between two pings.
===============================================================================
*/
struct Gateway {
    std::chrono::milliseconds ping_interval{std::chrono::seconds(15)};
    std::chrono::milliseconds liveness_window{std::chrono::seconds(45)};
    std::chrono::milliseconds auth_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds default_call_timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds upstream_timeout{std::chrono::seconds(30)};
    Route default_route{Route::Delegated};

    [[nodiscard]]
    inline bool valid() const noexcept {
        return ping_interval.count() > 0
            && liveness_window > ping_interval
            && auth_timeout.count() > 0
            && default_call_timeout.count() > 0
            && upstream_timeout.count() > 0;
    }
};

} // namespace relaygate::core::config
