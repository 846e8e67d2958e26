#pragma once

#include <string>

namespace relaygate::core {

// Opaque identity established by the external login flow.
using UserId = std::string;

} // namespace relaygate::core
