#include "relaygate/core/transport/beast/server.hpp"

#include <exception>
#include <utility>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include "lcr/log/logger.hpp"

namespace relaygate::core::transport::beast {

namespace net = boost::asio;
using tcp = net::ip::tcp;


Server::Server(config::Server cfg, AcceptHandler on_accept)
    : cfg_(std::move(cfg))
    , on_accept_(std::move(on_accept))
    , work_(net::make_work_guard(ioc_))
    , acceptor_(net::make_strand(ioc_))
{}

Server::~Server() {
    stop();
}

bool Server::start() {
    boost::system::error_code ec;
    const auto address = net::ip::make_address(cfg_.bind_address, ec);
    if (ec) {
        RG_ERROR("[WS] Invalid bind address '" << cfg_.bind_address << "': " << ec.message());
        return false;
    }
    const tcp::endpoint endpoint{address, cfg_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        RG_ERROR("[WS] Cannot listen on " << cfg_.bind_address << ":" << cfg_.port << ": " << ec.message());
        return false;
    }
    bound_port_.store(acceptor_.local_endpoint().port(), std::memory_order_release);
    RG_INFO("[WS] Listening on ws://" << cfg_.bind_address << ":" << port() << cfg_.path);

    accept_();
    io_thread_ = std::thread([this]() {
        try {
            ioc_.run();
        }
        catch (const std::exception& e) {
            RG_FATAL("[WS] IO thread terminated: " << e.what());
        }
    });
    return true;
}

void Server::stop() {
    if (!io_thread_.joinable()) {
        return;
    }
    net::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    });
    work_.reset();
    ioc_.stop();
    io_thread_.join();
    RG_INFO("[WS] Server stopped");
}

void Server::accept_() {
    acceptor_.async_accept(net::make_strand(ioc_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    RG_WARN("[WS] Accept failed: " << ec.message());
                }
                if (!acceptor_.is_open()) {
                    return;
                }
            }
            else {
                auto channel = std::make_shared<Channel>(std::move(socket), cfg_.path);
                RG_DEBUG("[WS] Accepted connection from " << channel->remote());
                on_accept_(channel);
                channel->run();
            }
            accept_();
        });
}

} // namespace relaygate::core::transport::beast
