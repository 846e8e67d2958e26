#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include "relaygate/core/config/gateway.hpp"
#include "relaygate/core/config/route_policy.hpp"
#include "relaygate/core/credentials/snapshot.hpp"
#include "relaygate/core/credentials/store.hpp"
#include "relaygate/core/error.hpp"
#include "relaygate/core/result.hpp"
#include "relaygate/core/route.hpp"
#include "relaygate/core/user_id.hpp"
#include "relaygate/core/executor/server_executor.hpp"
#include "relaygate/core/gateway/envelope.hpp"
#include "relaygate/core/http/concepts.hpp"
#include "relaygate/core/protocol/delegator.hpp"
#include "relaygate/core/request/built_request.hpp"
#include "relaygate/core/request/logical_request.hpp"
#include "relaygate/core/request/params.hpp"
#include "relaygate/core/request/template_engine.hpp"
#include "relaygate/core/transport/concepts.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"


namespace relaygate::core::gateway {

/*
===============================================================================
ExecutionRouter
===============================================================================

Single entry point for callers:

    execute(user, endpoint, params, route?, timeout?) -> Result

Per-call state machine (logged under [ROUTER]):

    RECEIVED → ROUTE_SERVER | ROUTE_DELEGATED → SUCCEEDED | FAILED

Rules:
  • The route comes from the explicit argument, else the RoutePolicy table.
    It is never derived from what the credential store happens to hold.
  • The request is built exactly once per call. The server path builds from
    the full snapshot; the delegated path from the snapshot minus cookies
    (the browser jar provides those). URL and header shape are identical.
  • The chosen path is final. A failure on one path is returned as is; the
    other path is never tried as a fallback.
===============================================================================
*/

template<
    http::HttpClientConcept Client,
    credentials::CredentialStoreConcept Store,
    transport::DelegateTransportConcept WS
>
class ExecutionRouter {
public:
    ExecutionRouter(const config::Gateway& cfg,
                    const config::RoutePolicy& policy,
                    Store& store,
                    executor::ServerExecutor<Client>& server,
                    protocol::Delegator<WS>& delegator) noexcept
        : cfg_(cfg)
        , policy_(policy)
        , store_(store)
        , server_(server)
        , delegator_(delegator)
    {}

    ExecutionRouter(const ExecutionRouter&) = delete;
    ExecutionRouter& operator=(const ExecutionRouter&) = delete;

    [[nodiscard]]
    Result execute(const UserId& user,
                   std::string_view endpoint,
                   const request::Params& params,
                   lcr::optional<Route> route = {},
                   lcr::optional<std::chrono::milliseconds> timeout = {}) {
        RG_DEBUG("[ROUTER] RECEIVED " << endpoint << " for user " << user);

        const Route chosen = policy_.resolve(user, route);

        credentials::CredentialSnapshot snapshot;
        const bool have_credentials = store_.lookup(user, snapshot);

        request::LogicalRequest logical{std::string(endpoint), params, user};
        request::BuiltRequest built;
        std::string detail;

        Result result;
        if (chosen == Route::Server) {
            RG_DEBUG("[ROUTER] ROUTE_SERVER " << endpoint << " for user " << user);
            const Error e = request::build(logical, snapshot, built, detail);
            if (e != Error::None) {
                result = Result::failure(e, std::move(detail), Route::Server);
            }
            else {
                if (!have_credentials) {
                    RG_DEBUG("[ROUTER] No stored credentials for user " << user);
                }
                result = server_.execute(built, snapshot);
            }
        }
        else {
            RG_DEBUG("[ROUTER] ROUTE_DELEGATED " << endpoint << " for user " << user);
            const Error e = request::build(logical, snapshot.for_delegation(), built, detail);
            if (e != Error::None) {
                result = Result::failure(e, std::move(detail), Route::Delegated);
            }
            else {
                const auto deadline = timeout.has() ? timeout.value() : cfg_.default_call_timeout;
                result = normalize_reply(delegator_.delegate(user, logical, built, deadline));
            }
        }

        if (result.ok()) {
            RG_INFO("[ROUTER] SUCCEEDED " << endpoint << " for user " << user
                    << " via " << to_string(result.route) << " (HTTP " << result.status_code << ")");
        }
        else {
            RG_INFO("[ROUTER] FAILED " << endpoint << " for user " << user
                    << " via " << to_string(result.route) << ": " << to_string(result.error)
                    << (result.message.empty() ? std::string() : " (" + result.message + ")"));
        }
        return result;
    }

    [[nodiscard]]
    inline Result execute(const request::LogicalRequest& req,
                          lcr::optional<Route> route = {},
                          lcr::optional<std::chrono::milliseconds> timeout = {}) {
        return execute(req.user_id, req.endpoint, req.params, route, timeout);
    }

private:
    config::Gateway cfg_;
    const config::RoutePolicy& policy_;
    Store& store_;
    executor::ServerExecutor<Client>& server_;
    protocol::Delegator<WS>& delegator_;
};

} // namespace relaygate::core::gateway
