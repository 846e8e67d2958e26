#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "relaygate/core/transport/concepts.hpp"


namespace relaygate::core::transport::beast {

/*
================================================================================
WebSocket Channel (Boost.Beast, server side)
================================================================================

One accepted browser connection.

  • All socket work runs on the connection's strand; send() and close() only
    post to it and may be called from any thread.
  • Outbound frames are queued and written one at a time, in send() order.
  • The upgrade request must target the configured path; anything else is
    answered with a plain HTTP 404 and the connection is dropped.
  • The message callback sees every text frame in arrival order. The close
    callback fires exactly once, whether the peer left, the socket failed, or
    close() was called.

Callbacks must be installed before run().
================================================================================
*/
class Channel : public std::enable_shared_from_this<Channel> {
public:
    using MessageCallback = std::function<void(std::string_view)>;
    using CloseCallback   = std::function<void()>;

    Channel(boost::asio::ip::tcp::socket&& socket, std::string path);
    ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Starts the HTTP upgrade and the read loop.
    void run();

    [[nodiscard]]
    bool send(const std::string& msg) noexcept;

    void close() noexcept;

    void set_message_callback(MessageCallback cb);
    void set_close_callback(CloseCallback cb);

    [[nodiscard]]
    const std::string& remote() const noexcept { return remote_; }

private:
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> upgrade_;

    std::string path_;
    std::string remote_;

    // Strand only
    std::deque<std::string> outbox_;
    bool closing_{false};
    bool close_sent_{false};

    std::atomic<bool> open_{false};
    std::atomic<bool> closed_{false};

    MessageCallback on_message_;
    CloseCallback on_close_;

private:
    void on_upgrade_read_(boost::beast::error_code ec, std::size_t bytes);
    void reject_upgrade_();
    void on_accept_(boost::beast::error_code ec);
    void read_();
    void on_read_(boost::beast::error_code ec, std::size_t bytes);
    void enqueue_(std::string msg);
    void write_next_();
    void on_write_(boost::beast::error_code ec, std::size_t bytes);
    void close_on_strand_();
    void notify_closed_();
};
static_assert(DelegateTransportConcept<Channel>);

} // namespace relaygate::core::transport::beast
