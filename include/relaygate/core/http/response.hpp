#pragma once

#include <string>

#include "relaygate/core/http/header.hpp"

namespace relaygate::core::http {

// Raw upstream response as delivered by an HTTP client.
struct Response {
    long status_code{0};
    HeaderList headers;
    std::string body;
};

} // namespace relaygate::core::http
