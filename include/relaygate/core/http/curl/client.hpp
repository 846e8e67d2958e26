#pragma once

#include <chrono>
#include <string>

#include "relaygate/core/http/concepts.hpp"
#include "relaygate/core/http/response.hpp"
#include "relaygate/core/request/built_request.hpp"

namespace relaygate::core::http::curl {

// Process-wide libcurl initialization. Create one before any Client is used
// and keep it alive until every Client is gone.
class Global {
public:
    Global();
    ~Global();

    Global(const Global&) = delete;
    Global& operator=(const Global&) = delete;
    Global(Global&&) = delete;
    Global& operator=(Global&&) = delete;
};


struct ClientConfig {
    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds total_timeout{30'000};
    bool verify_peer{true};
};

/*
===============================================================================
libcurl-backed HTTP client
===============================================================================

Each perform() call owns a fresh easy handle, so one Client may be shared by
every routing thread. Redirects are not followed and no header is added or
reordered: the upstream sees the BuiltRequest byte for byte, apart from the
transport-level headers libcurl always emits (Host, Content-Length).
No Accept-Encoding is negotiated, so response bodies arrive uncompressed.
===============================================================================
*/
class Client {
public:
    Client() = default;
    explicit Client(ClientConfig cfg) noexcept
        : cfg_(cfg)
    {}

    [[nodiscard]]
    bool perform(const request::BuiltRequest& req, Response& resp, std::string& error) noexcept;

    [[nodiscard]]
    const ClientConfig& config() const noexcept { return cfg_; }

private:
    ClientConfig cfg_{};
};
static_assert(HttpClientConcept<Client>);

} // namespace relaygate::core::http::curl
