#pragma once

#include <cstdint>
#include <string>


namespace relaygate::core::config {

// Listening endpoint for delegate connections.
struct Server {
    std::string bind_address{"127.0.0.1"};
    std::uint16_t port{8765};
    std::string path{"/ws"};
};

} // namespace relaygate::core::config
