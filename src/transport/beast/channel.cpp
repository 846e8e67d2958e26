#include "relaygate/core/transport/beast/channel.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include "lcr/log/logger.hpp"

namespace relaygate::core::transport::beast {

namespace net = boost::asio;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using boost::beast::error_code;

namespace {

// "/ws" matches "/ws" and "/ws?..." but not "/wsx".
bool target_matches(std::string_view target, std::string_view path) noexcept {
    if (target.substr(0, path.size()) != path) {
        return false;
    }
    return target.size() == path.size() || target[path.size()] == '?';
}

} // namespace


Channel::Channel(net::ip::tcp::socket&& socket, std::string path)
    : ws_(std::move(socket))
    , path_(std::move(path))
{
    error_code ec;
    const auto ep = boost::beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

Channel::~Channel() {
    RG_TRACE("[WS] Channel " << remote_ << " destroyed");
}

void Channel::set_message_callback(MessageCallback cb) {
    on_message_ = std::move(cb);
}

void Channel::set_close_callback(CloseCallback cb) {
    on_close_ = std::move(cb);
}

void Channel::run() {
    net::dispatch(ws_.get_executor(), [self = shared_from_this()]() {
        boost::beast::get_lowest_layer(self->ws_).expires_after(std::chrono::seconds(30));
        http::async_read(self->ws_.next_layer(), self->buffer_, self->upgrade_,
            [self](error_code ec, std::size_t bytes) { self->on_upgrade_read_(ec, bytes); });
    });
}

bool Channel::send(const std::string& msg) noexcept {
    if (!open_.load(std::memory_order_acquire) || closed_.load(std::memory_order_acquire)) {
        return false;
    }
    try {
        net::post(ws_.get_executor(), [self = shared_from_this(), msg]() mutable {
            self->enqueue_(std::move(msg));
        });
    }
    catch (const std::exception& e) {
        RG_ERROR("[WS] Failed to queue frame for " << remote_ << ": " << e.what());
        return false;
    }
    return true;
}

void Channel::close() noexcept {
    if (closed_.load(std::memory_order_acquire)) {
        return;
    }
    try {
        net::post(ws_.get_executor(), [self = shared_from_this()]() {
            self->close_on_strand_();
        });
    }
    catch (const std::exception& e) {
        RG_ERROR("[WS] Failed to schedule close for " << remote_ << ": " << e.what());
    }
}

// ----------------------------------------------------------------------------
// Upgrade
// ----------------------------------------------------------------------------

void Channel::on_upgrade_read_(error_code ec, std::size_t) {
    if (ec) {
        RG_DEBUG("[WS] Upgrade read from " << remote_ << " failed: " << ec.message());
        notify_closed_();
        return;
    }
    const std::string_view target(upgrade_.target().data(), upgrade_.target().size());
    if (!websocket::is_upgrade(upgrade_) || !target_matches(target, path_)) {
        RG_WARN("[WS] Rejecting request from " << remote_ << " for '" << target << "'");
        reject_upgrade_();
        return;
    }

    boost::beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "relaygate");
    }));
    ws_.text(true);
    ws_.async_accept(upgrade_,
        [self = shared_from_this()](error_code e) { self->on_accept_(e); });
}

void Channel::reject_upgrade_() {
    auto res = std::make_shared<http::response<http::string_body>>(http::status::not_found, upgrade_.version());
    res->set(http::field::server, "relaygate");
    res->set(http::field::content_type, "text/plain");
    res->keep_alive(false);
    res->body() = "not found\n";
    res->prepare_payload();
    http::async_write(ws_.next_layer(), *res,
        [self = shared_from_this(), res](error_code, std::size_t) {
            error_code ignored;
            boost::beast::get_lowest_layer(self->ws_).socket().shutdown(net::ip::tcp::socket::shutdown_both, ignored);
            self->notify_closed_();
        });
}

void Channel::on_accept_(error_code ec) {
    if (ec) {
        RG_WARN("[WS] Handshake with " << remote_ << " failed: " << ec.message());
        notify_closed_();
        return;
    }
    open_.store(true, std::memory_order_release);
    RG_INFO("[WS] Connection from " << remote_ << " upgraded");
    read_();
}

// ----------------------------------------------------------------------------
// Read loop
// ----------------------------------------------------------------------------

void Channel::read_() {
    ws_.async_read(buffer_,
        [self = shared_from_this()](error_code ec, std::size_t bytes) { self->on_read_(ec, bytes); });
}

void Channel::on_read_(error_code ec, std::size_t) {
    if (ec) {
        if (ec == websocket::error::closed) {
            RG_INFO("[WS] Peer " << remote_ << " closed the connection");
        }
        else if (!closing_) {
            RG_WARN("[WS] Read from " << remote_ << " failed: " << ec.message());
        }
        open_.store(false, std::memory_order_release);
        notify_closed_();
        return;
    }

    const auto data = buffer_.cdata();
    const std::string_view msg(static_cast<const char*>(data.data()), data.size());
    if (on_message_) {
        on_message_(msg);
    }
    buffer_.consume(buffer_.size());

    if (!closed_.load(std::memory_order_acquire)) {
        read_();
    }
}

// ----------------------------------------------------------------------------
// Write queue
// ----------------------------------------------------------------------------

void Channel::enqueue_(std::string msg) {
    if (closing_ || closed_.load(std::memory_order_acquire)) {
        return;
    }
    outbox_.push_back(std::move(msg));
    if (outbox_.size() == 1) {
        write_next_();
    }
}

void Channel::write_next_() {
    ws_.async_write(net::buffer(outbox_.front()),
        [self = shared_from_this()](error_code ec, std::size_t bytes) { self->on_write_(ec, bytes); });
}

void Channel::on_write_(error_code ec, std::size_t) {
    if (ec) {
        RG_WARN("[WS] Write to " << remote_ << " failed: " << ec.message());
        outbox_.clear();
        open_.store(false, std::memory_order_release);
        error_code ignored;
        boost::beast::get_lowest_layer(ws_).socket().close(ignored);
        return;
    }
    outbox_.pop_front();
    if (!outbox_.empty()) {
        write_next_();
    }
    else if (closing_) {
        close_on_strand_();
    }
}

// ----------------------------------------------------------------------------
// Close
// ----------------------------------------------------------------------------

void Channel::close_on_strand_() {
    if (close_sent_) {
        return;
    }
    closing_ = true;
    if (!open_.load(std::memory_order_acquire)) {
        error_code ignored;
        boost::beast::get_lowest_layer(ws_).socket().close(ignored);
        notify_closed_();
        return;
    }
    // Drain queued frames (the error notice before a teardown) first.
    if (!outbox_.empty()) {
        return;
    }
    close_sent_ = true;
    open_.store(false, std::memory_order_release);
    ws_.async_close(websocket::close_code::normal,
        [self = shared_from_this()](error_code ec) {
            if (ec) {
                RG_DEBUG("[WS] Close handshake with " << self->remote_ << " failed: " << ec.message());
                error_code ignored;
                boost::beast::get_lowest_layer(self->ws_).socket().close(ignored);
            }
            self->notify_closed_();
        });
}

void Channel::notify_closed_() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (on_close_) {
        on_close_();
    }
}

} // namespace relaygate::core::transport::beast
