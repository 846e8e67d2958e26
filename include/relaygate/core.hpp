#pragma once

/*
================================================================================
RelayGate Core: Dual-Path Execution Gateway
================================================================================

Callers describe an upstream call logically:

    router.execute(user, "feed", {{"count", 10}, {"start", 0}})

and RelayGate runs it on exactly one of two paths:

  Server path
    The Request Template Engine builds the HTTP request from the user's stored
    credential snapshot and the libcurl executor sends it from this process.

  Delegated path
    The same request (same URL, same header shape, cookies left to the
    browser jar) is forwarded over the user's authenticated WebSocket to a
    browser-side executor, and the caller waits for the correlated response.

Both paths resolve into one relaygate::core::Result.

-------------------------------------------------------------------------------
Execution model
-------------------------------------------------------------------------------

    [1] IO thread          Boost.Beast accept / read / write (transport::beast)
    [2] Maintenance        Hub::tick(): pings, liveness, auth and call timeouts
    [N] Caller threads     ExecutionRouter::execute(), blocking per call

A caller blocks only on its own call slot. The IO thread never blocks on a
caller: it removes the matching pending entry and fulfills the slot.

-------------------------------------------------------------------------------
Composition
-------------------------------------------------------------------------------

    using Channel  = transport::beast::Channel;
    using Hub      = protocol::Hub<Channel>;
    using Executor = executor::ServerExecutor<http::curl::Client>;
    using Router   = gateway::ExecutionRouter<http::curl::Client,
                                              credentials::InMemoryCredentialStore,
                                              Channel>;

Every seam is a C++20 concept (HttpClientConcept, CredentialStoreConcept,
DelegateTransportConcept), so tests swap in mocks without virtual dispatch.
================================================================================
*/

#include "relaygate/core/error.hpp"
#include "relaygate/core/result.hpp"
#include "relaygate/core/route.hpp"
#include "relaygate/core/user_id.hpp"
#include "relaygate/core/config/gateway.hpp"
#include "relaygate/core/config/route_policy.hpp"
#include "relaygate/core/config/server.hpp"
#include "relaygate/core/credentials/snapshot.hpp"
#include "relaygate/core/credentials/store.hpp"
#include "relaygate/core/request/endpoint.hpp"
#include "relaygate/core/request/params.hpp"
#include "relaygate/core/request/template_engine.hpp"
#include "relaygate/core/request/urn.hpp"
#include "relaygate/core/http/curl/client.hpp"
#include "relaygate/core/executor/server_executor.hpp"
#include "relaygate/core/protocol/delegator.hpp"
#include "relaygate/core/protocol/hub.hpp"
#include "relaygate/core/protocol/token_validator.hpp"
#include "relaygate/core/registry/connection_registry.hpp"
#include "relaygate/core/gateway/router.hpp"
#include "relaygate/core/transport/beast/channel.hpp"
#include "relaygate/core/transport/beast/server.hpp"


namespace relaygate::core {

using Channel   = transport::beast::Channel;
using Hub       = protocol::Hub<Channel>;
using Delegator = protocol::Delegator<Channel>;
using Executor  = executor::ServerExecutor<http::curl::Client>;
using Router    = gateway::ExecutionRouter<http::curl::Client, credentials::InMemoryCredentialStore, Channel>;

} // namespace relaygate::core
