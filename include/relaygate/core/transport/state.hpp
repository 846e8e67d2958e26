#pragma once

#include <cstdint>
#include <string_view>


namespace relaygate::core::transport {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
//
//   Connecting ──auth──► Open ──close()──► Closing ──► Closed
//       │                 │
//       └──── transport loss / liveness / protocol error ──► Disconnected
//
// Closed and Disconnected are terminal. Only Open connections accept
// delegated calls.
enum class State : uint8_t {
    Connecting,
    Open,
    Closing,
    Closed,
    Disconnected
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Connecting:   return "Connecting";
        case State::Open:         return "Open";
        case State::Closing:      return "Closing";
        case State::Closed:       return "Closed";
        case State::Disconnected: return "Disconnected";
        default:                  return "Unknown";
    }
}

[[nodiscard]]
inline constexpr bool is_terminal(State s) noexcept {
    return s == State::Closed || s == State::Disconnected;
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : uint8_t {
    None,
    LocalClose,        // explicit close() by the gateway
    Superseded,        // a newer connection registered for the same user
    RemoteClose,       // peer closed the transport
    TransportError,    // socket / IO error
    LivenessTimeout,   // no pong within the liveness window
    AuthTimeout,       // no auth message within the auth window
    AuthRejected,      // token validator refused the identity
    ProtocolError      // malformed or unexpected message
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:            return "None";
        case DisconnectReason::LocalClose:      return "LocalClose";
        case DisconnectReason::Superseded:      return "Superseded";
        case DisconnectReason::RemoteClose:     return "RemoteClose";
        case DisconnectReason::TransportError:  return "TransportError";
        case DisconnectReason::LivenessTimeout: return "LivenessTimeout";
        case DisconnectReason::AuthTimeout:     return "AuthTimeout";
        case DisconnectReason::AuthRejected:    return "AuthRejected";
        case DisconnectReason::ProtocolError:   return "ProtocolError";
        default:                                return "Unknown";
    }
}

// Graceful reasons end in Closed, the rest in Disconnected.
[[nodiscard]]
inline constexpr bool is_graceful(DisconnectReason r) noexcept {
    return r == DisconnectReason::LocalClose || r == DisconnectReason::Superseded;
}

} // namespace relaygate::core::transport
