#pragma once

#include <string>
#include <string_view>
#include <concepts>
#include <functional>

namespace relaygate::core::transport {

// -----------------------------------------------------------------------------
// DelegateTransportConcept
// -----------------------------------------------------------------------------
//
// Minimal contract between a per-connection protocol session and the duplex
// channel to one browser-side executor.
//
// The transport:
//
//   • Owns its IO (thread, event loop or test script)
//   • Delivers every inbound text frame through the message callback, in
//     arrival order, from a single reader context
//   • Invokes the close callback exactly once when the channel is gone,
//     whether closed locally or lost
//   • send() never blocks on the network: it queues or writes and returns
//     false only when the channel can no longer carry frames
//
// -----------------------------------------------------------------------------

template<class T>
concept DelegateTransportConcept =
    requires(
        T transport,
        const std::string& msg,
        std::function<void(std::string_view)> on_message,
        std::function<void()> on_close
    )
{
    { transport.send(msg) } noexcept -> std::same_as<bool>;
    { transport.close() } noexcept -> std::same_as<void>;

    { transport.set_message_callback(on_message) } -> std::same_as<void>;
    { transport.set_close_callback(on_close) } -> std::same_as<void>;
};

} // namespace relaygate::core::transport
