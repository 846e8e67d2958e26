#pragma once

#include <cstdint>
#include <string_view>


namespace relaygate::core::protocol::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Parsed        = 0,   // Parsed successfully
    Ignored       = 1,   // Well-formed but not applicable (unknown optional content)
    InvalidJson   = 2,   // Structural failure
    InvalidSchema = 3,   // Missing required field, type mismatch, unknown type
    InvalidValue  = 4    // Field present but semantically invalid
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Parsed:        return "Parsed";
        case Result::Ignored:       return "Ignored";
        case Result::InvalidJson:   return "InvalidJson";
        case Result::InvalidSchema: return "InvalidSchema";
        case Result::InvalidValue:  return "InvalidValue";
        default:                    return "unknown";
    }
}

} // namespace relaygate::core::protocol::parser
