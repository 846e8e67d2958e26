#pragma once

#include <string>

#include "relaygate/core/request/params.hpp"
#include "relaygate/core/user_id.hpp"

namespace relaygate::core::request {

// A call as the caller expressed it: which endpoint, which parameters, for whom.
// Built once per call and passed by const reference afterwards.
struct LogicalRequest {
    std::string endpoint;
    Params      params;
    UserId      user_id;

    [[nodiscard]]
    bool operator==(const LogicalRequest&) const = default;
};

} // namespace relaygate::core::request
