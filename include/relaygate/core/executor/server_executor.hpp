#pragma once

#include <string>
#include <utility>

#include "relaygate/core/credentials/snapshot.hpp"
#include "relaygate/core/http/concepts.hpp"
#include "relaygate/core/http/status.hpp"
#include "relaygate/core/request/built_request.hpp"
#include "relaygate/core/result.hpp"
#include "lcr/log/logger.hpp"

namespace relaygate::core::executor {

/*
===============================================================================
Server Executor
===============================================================================

Sends a BuiltRequest directly from the gateway and classifies the upstream
status. One attempt per call: retry policy belongs to the caller.

Preconditions checked before any I/O:
  • the snapshot must be server-ready (csrf token, li_at, JSESSIONID);
    otherwise Error::IncompleteCredentials is returned and the HTTP client
    is never touched.

Outcome mapping:
  • transport failure        → TransportFailure (message = client reason)
  • HTTP status              → http::classify_status()
  • 429 with Retry-After     → RateLimited + retry_after
Status code, headers and body are attached to the result on every HTTP
response, success or not.
===============================================================================
*/
template<http::HttpClientConcept Client>
class ServerExecutor {
public:
    explicit ServerExecutor(Client& client) noexcept
        : client_(client)
    {}

    ServerExecutor(const ServerExecutor&) = delete;
    ServerExecutor& operator=(const ServerExecutor&) = delete;

    [[nodiscard]]
    Result execute(const request::BuiltRequest& req, const credentials::CredentialSnapshot& creds) {
        if (!creds.is_server_ready()) {
            RG_WARN("[HTTP] Refusing direct execution of " << req.method << " " << req.url
                    << ": credential snapshot lacks csrf token or session cookies");
            return Result::failure(Error::IncompleteCredentials,
                                   "credential snapshot is incomplete for direct execution", Route::Server);
        }

        http::Response resp;
        std::string reason;
        if (!client_.perform(req, resp, reason)) {
            return Result::failure(Error::TransportFailure, std::move(reason), Route::Server);
        }

        Result out;
        out.route = Route::Server;
        out.error = http::classify_status(resp.status_code);
        out.status_code = resp.status_code;
        if (out.error == Error::RateLimited) {
            out.retry_after = http::retry_after(resp.headers);
        }
        if (!out.ok()) {
            out.message = "upstream responded with HTTP " + std::to_string(resp.status_code);
            RG_INFO("[HTTP] " << req.method << " " << req.url << " classified as " << to_string(out.error)
                    << " (HTTP " << resp.status_code << ")");
        }
        out.headers = std::move(resp.headers);
        out.body = std::move(resp.body);
        return out;
    }

private:
    Client& client_;
};

} // namespace relaygate::core::executor
