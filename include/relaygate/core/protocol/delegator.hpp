#pragma once

#include <chrono>

#include "relaygate/core/error.hpp"
#include "relaygate/core/user_id.hpp"
#include "relaygate/core/request/built_request.hpp"
#include "relaygate/core/request/logical_request.hpp"
#include "relaygate/core/protocol/reply.hpp"
#include "relaygate/core/registry/connection_registry.hpp"
#include "relaygate/core/transport/concepts.hpp"
#include "lcr/log/logger.hpp"


namespace relaygate::core::protocol {

// Dispatch entry point of the delegated path: resolves the user's Open
// connection and runs one correlated call on it. A user without one gets
// NoDelegateAvailable and nothing is written anywhere.
template<transport::DelegateTransportConcept WS>
class Delegator {
public:
    explicit Delegator(registry::ConnectionRegistry<WS>& registry) noexcept
        : registry_(registry)
    {}

    [[nodiscard]]
    Reply delegate(const UserId& user, const request::LogicalRequest& logical,
                   const request::BuiltRequest& http, std::chrono::milliseconds timeout) const {
        auto session = registry_.lookup(user);
        if (!session) {
            RG_INFO("[SESSION] No open delegate connection for user " << user);
            return Reply::failure(Error::NoDelegateAvailable, "no open delegate connection for user");
        }
        return session->call(logical, http, timeout);
    }

private:
    registry::ConnectionRegistry<WS>& registry_;
};

} // namespace relaygate::core::protocol
