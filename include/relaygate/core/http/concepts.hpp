#pragma once

#include <concepts>
#include <string>

#include "relaygate/core/http/response.hpp"
#include "relaygate/core/request/built_request.hpp"

namespace relaygate::core::http {

// HTTP client port used by the server executor.
//
// perform() sends 'req' exactly as built (method, URL, header order, body)
// and fills 'resp' with whatever status the upstream answered. It returns
// false only when no HTTP response was obtained at all, with a short reason
// in 'error'. perform() must not throw and must be callable from several
// threads at once.
template<class C>
concept HttpClientConcept =
    requires(C& client, const request::BuiltRequest& req, Response& resp, std::string& error) {
        { client.perform(req, resp, error) } -> std::same_as<bool>;
    };

} // namespace relaygate::core::http
