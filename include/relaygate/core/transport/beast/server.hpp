#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "relaygate/core/config/server.hpp"
#include "relaygate/core/transport/beast/channel.hpp"


namespace relaygate::core::transport::beast {

// Accepts delegate connections and hands each one, callbacks not yet
// installed, to the accept handler. The channel's upgrade starts right after
// the handler returns.
//
// One io_context, serviced by a single IO thread started by start().
class Server {
public:
    using AcceptHandler = std::function<void(std::shared_ptr<Channel>)>;

    Server(config::Server cfg, AcceptHandler on_accept);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds, listens and starts the IO thread. Returns false (and logs) if
    // the endpoint cannot be bound.
    [[nodiscard]]
    bool start();

    void stop();

    [[nodiscard]]
    boost::asio::io_context& context() noexcept { return ioc_; }

    // Actual listening port (useful when configured with port 0).
    [[nodiscard]]
    std::uint16_t port() const noexcept { return bound_port_.load(std::memory_order_acquire); }

private:
    config::Server cfg_;
    AcceptHandler on_accept_;

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread io_thread_;
    std::atomic<std::uint16_t> bound_port_{0};

private:
    void accept_();
};

} // namespace relaygate::core::transport::beast
