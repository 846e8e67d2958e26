#pragma once

#include <cstdint>
#include <string_view>

namespace relaygate::core::protocol {

// ===============================================================
// Wire message "type" values
// ===============================================================
enum class MessageType : uint8_t {
    Auth,           // client → gateway, first message only
    AuthSuccess,    // gateway → client
    Ping,           // both directions
    Pong,           // both directions
    Request,        // gateway → client
    Response,       // client → gateway
    Notification,   // gateway → client
    Error,          // both directions
    Unknown
};

[[nodiscard]]
inline constexpr std::string_view to_string(MessageType t) noexcept {
    switch (t) {
        case MessageType::Auth:         return "auth";
        case MessageType::AuthSuccess:  return "auth_success";
        case MessageType::Ping:         return "ping";
        case MessageType::Pong:         return "pong";
        case MessageType::Request:      return "request";
        case MessageType::Response:     return "response";
        case MessageType::Notification: return "notification";
        case MessageType::Error:        return "error";
        default:                        return "unknown";
    }
}

[[nodiscard]]
inline constexpr MessageType to_message_type(std::string_view s) noexcept {
    if (s == "auth")         return MessageType::Auth;
    if (s == "auth_success") return MessageType::AuthSuccess;
    if (s == "ping")         return MessageType::Ping;
    if (s == "pong")         return MessageType::Pong;
    if (s == "request")      return MessageType::Request;
    if (s == "response")     return MessageType::Response;
    if (s == "notification") return MessageType::Notification;
    if (s == "error")        return MessageType::Error;
    return MessageType::Unknown;
}

// Types a browser-side client is allowed to send.
[[nodiscard]]
inline constexpr bool is_inbound(MessageType t) noexcept {
    return t == MessageType::Auth
        || t == MessageType::Ping
        || t == MessageType::Pong
        || t == MessageType::Response
        || t == MessageType::Error;
}

} // namespace relaygate::core::protocol
