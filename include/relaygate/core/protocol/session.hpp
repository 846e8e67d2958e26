/*
===============================================================================
Delegate protocol Session
===============================================================================

One Session drives one duplex channel to one browser-side executor. It owns
the correlation state of that channel and nothing else.

Architecture:
  - transport::*             → duplex channel (Boost.Beast WebSocket, mockable)
  - protocol::parser::Router → frame validation and typed dispatch
  - protocol::PendingCalls   → correlation id → waiting caller
  - protocol::Session        → auth handshake, liveness, call correlation

Lifecycle:

    Connecting ──auth ok──► Open ──close()──► Closing ──► Closed | Disconnected
        │                    │
        └──── auth rejected / timeout, protocol error, transport loss,
              liveness timeout ──────────────────────────────► Disconnected

Threading model:
  - on_message() / on_transport_closed() come from the transport's reader
  - call() is invoked from any number of caller threads and blocks only the
    calling thread on its own CallSlot
  - poll() is driven periodically by the owner (Hub::tick)
  - mutex_ guards state and the pending table; write_mutex_ serializes
    outbound frames. Slots are always fulfilled outside mutex_.

Exactly-once resolution:
  Every PendingCall is removed by exactly one of the response path, the
  caller's own deadline, the poll() sweep or a connection teardown. The one
  that removed it fulfills the slot; everybody else finds nothing to take.
===============================================================================
*/

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "relaygate/core/config/gateway.hpp"
#include "relaygate/core/error.hpp"
#include "relaygate/core/user_id.hpp"
#include "relaygate/core/request/built_request.hpp"
#include "relaygate/core/request/logical_request.hpp"
#include "relaygate/core/transport/concepts.hpp"
#include "relaygate/core/transport/state.hpp"
#include "relaygate/core/protocol/call_slot.hpp"
#include "relaygate/core/protocol/message_type.hpp"
#include "relaygate/core/protocol/pending_calls.hpp"
#include "relaygate/core/protocol/reply.hpp"
#include "relaygate/core/protocol/parser/router.hpp"
#include "relaygate/core/protocol/schema/auth.hpp"
#include "relaygate/core/protocol/schema/error_notice.hpp"
#include "relaygate/core/protocol/schema/notification.hpp"
#include "relaygate/core/protocol/schema/ping.hpp"
#include "relaygate/core/protocol/schema/pong.hpp"
#include "relaygate/core/protocol/schema/request.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"
#include "lcr/sequence.hpp"


namespace relaygate::core::protocol {

template<transport::DelegateTransportConcept WS>
class Session : public std::enable_shared_from_this<Session<WS>> {
public:
    using Clock = CallSlot::Clock;

    // Owner callbacks. All optional except authenticate (a session without a
    // validator rejects every token).
    struct Hooks {
        std::function<bool(std::string_view token, UserId& user)> authenticate;
        std::function<void(Session&)> on_open;
        std::function<void(Session&)> on_closed;
    };

    Session(std::shared_ptr<WS> ws, const config::Gateway& cfg, Hooks hooks, Clock::time_point now = Clock::now())
        : ws_(std::move(ws))
        , cfg_(cfg)
        , hooks_(std::move(hooks))
        , created_at_(now)
        , last_ping_(now)
        , last_pong_(now)
    {}

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Wires transport callbacks. Must be called once the Session is owned by
    // a shared_ptr; the callbacks hold only a weak reference.
    inline void start() {
        std::weak_ptr<Session> weak = this->shared_from_this();
        ws_->set_message_callback([weak](std::string_view msg) {
            if (auto self = weak.lock()) {
                self->on_message(msg);
            }
        });
        ws_->set_close_callback([weak]() {
            if (auto self = weak.lock()) {
                self->on_transport_closed();
            }
        });
        RG_DEBUG("[SESSION] Connection accepted, awaiting auth");
    }

    // -------------------------------------------------------------------------
    // Delegated call
    // -------------------------------------------------------------------------
    //
    // Sends one 'request' frame and blocks the calling thread until the
    // matching response, the deadline, or connection loss.
    //
    [[nodiscard]]
    Reply call(const request::LogicalRequest& logical, const request::BuiltRequest& http, std::chrono::milliseconds timeout) {
        auto slot = std::make_shared<CallSlot>();
        std::string id = "c-" + std::to_string(correlation_seq_.next());
        const auto deadline = Clock::now() + timeout;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != transport::State::Open) {
                return Reply::failure(Error::Disconnected, "connection is not open");
            }
            if (!pending_.insert(PendingCall{id, logical, deadline, slot})) {
                RG_ERROR("[SESSION] Correlation id " << id << " already pending for user " << user_);
                return Reply::failure(Error::ProtocolError, "correlation id collision");
            }
        }

        const std::string frame = schema::RequestView{id, logical, http}.to_json();
        if (!send_(frame)) {
            if (take_(id)) {
                RG_WARN("[SESSION] Failed to write request " << id << " (" << logical.endpoint << ") for user " << user_);
                return Reply::failure(Error::TransportFailure, "failed to write request frame");
            }
            // Teardown already claimed the entry and resolved the slot.
            Reply reply;
            slot->wait(reply);
            return reply;
        }
        RG_DEBUG("[SESSION] Sent request " << id << " (" << logical.endpoint << ") to user " << user_);

        Reply reply;
        if (slot->wait_until(deadline, reply)) {
            return reply;
        }
        if (take_(id)) {
            RG_INFO("[SESSION] Request " << id << " (" << logical.endpoint << ") timed out after "
                    << timeout.count() << " ms");
            reply = Reply::failure(Error::Timeout, "delegated call timed out");
            slot->fulfill(reply);
            return reply;
        }
        // Another remover won the race between our wakeup and take_(); its
        // fulfillment is imminent.
        slot->wait(reply);
        return reply;
    }

    // Fire-and-forget notification. Returns false if the channel is not Open
    // or the frame could not be written.
    inline bool notify(const schema::Notification& n) {
        if (state() != transport::State::Open) {
            return false;
        }
        return send_(n.to_json());
    }

    // -------------------------------------------------------------------------
    // Inbound frames (transport reader context)
    // -------------------------------------------------------------------------
    void on_message(std::string_view raw) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == transport::State::Closing || transport::is_terminal(state_)) {
                RG_TRACE("[SESSION] Dropping frame received after close: " << raw);
                return;
            }
        }

        MessageType type;
        parser::Inbound msg;
        const auto r = parser_.parse(raw, type, msg);
        if (r != parser::Result::Parsed) {
            violation_("malformed or unsupported message (" + std::string(parser::to_string(r)) + ")");
            return;
        }

        const bool authenticated = state() != transport::State::Connecting;
        if (!authenticated && type != MessageType::Auth) {
            violation_("first message must be auth, got '" + std::string(to_string(type)) + "'");
            return;
        }

        switch (type) {
            case MessageType::Auth:
                if (authenticated) {
                    violation_("duplicate auth");
                    return;
                }
                handle_auth_(std::get<schema::Auth>(msg));
                break;
            case MessageType::Ping:
                handle_ping_(std::get<schema::PingIn>(msg));
                break;
            case MessageType::Pong:
                handle_pong_(std::get<schema::Pong>(msg));
                break;
            case MessageType::Response:
                handle_response_(std::get<schema::Response>(msg));
                break;
            case MessageType::Error:
                handle_error_(std::get<schema::ErrorNotice>(msg));
                break;
            default:
                // Router only yields Parsed for inbound types.
                violation_("unexpected message type '" + std::string(to_string(type)) + "'");
                break;
        }
    }

    // Peer closed or the channel failed.
    inline void on_transport_closed() {
        finish_(transport::DisconnectReason::RemoteClose);
    }

    // -------------------------------------------------------------------------
    // Local close
    // -------------------------------------------------------------------------
    //
    // Fails every outstanding call with Disconnected before the transport is
    // asked to close. Graceful reasons end in Closed, the rest in Disconnected.
    //
    void close(transport::DisconnectReason reason = transport::DisconnectReason::LocalClose) {
        std::vector<PendingCall> orphans;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == transport::State::Closing || transport::is_terminal(state_)) {
                return;
            }
            RG_INFO("[SESSION] Closing connection" << (user_.empty() ? std::string() : " for user " + user_)
                    << " (" << to_string(reason) << ")");
            state_ = transport::State::Closing;
            close_reason_ = reason;
            orphans = pending_.take_all();
        }
        fail_(orphans, Error::Disconnected, "connection closed");
        ws_->close();
        finish_(reason);
    }

    // -------------------------------------------------------------------------
    // Periodic maintenance
    // -------------------------------------------------------------------------
    //
    //   • auth timeout while Connecting
    //   • liveness window while Open (no pong → Disconnected)
    //   • ping every ping_interval while Open
    //   • expiry sweep of pending calls
    //
    void poll(Clock::time_point now) {
        enum class Action { None, AuthTimeout, LivenessTimeout, Ping };
        Action action = Action::None;
        std::vector<PendingCall> expired;
        lcr::optional<std::uint64_t> ping_id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == transport::State::Connecting) {
                if (now - created_at_ >= cfg_.auth_timeout) {
                    action = Action::AuthTimeout;
                }
            }
            else if (state_ == transport::State::Open) {
                if (now - last_pong_ > cfg_.liveness_window) {
                    action = Action::LivenessTimeout;
                }
                else if (now - last_ping_ >= cfg_.ping_interval) {
                    action = Action::Ping;
                    last_ping_ = now;
                    ping_id = ping_seq_.next();
                }
                expired = pending_.take_expired(now);
            }
        }

        if (!expired.empty()) {
            RG_INFO("[SESSION] Swept " << expired.size() << " expired call(s) for user " << user_);
            fail_(expired, Error::Timeout, "delegated call timed out");
        }

        switch (action) {
            case Action::AuthTimeout:
                RG_WARN("[SESSION] No auth received within " << cfg_.auth_timeout.count() << " ms");
                send_(schema::ErrorNotice{"Authentication timeout", schema::error_code::AUTH_TIMEOUT}.to_json());
                close(transport::DisconnectReason::AuthTimeout);
                break;
            case Action::LivenessTimeout:
                RG_WARN("[SESSION] No pong from user " << user_ << " within "
                        << cfg_.liveness_window.count() << " ms, forcing disconnect");
                close(transport::DisconnectReason::LivenessTimeout);
                break;
            case Action::Ping:
                if (!send_(schema::Ping{ping_id}.to_json())) {
                    RG_WARN("[SESSION] Failed to write ping to user " << user_);
                }
                break;
            default:
                break;
        }
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline transport::State state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    [[nodiscard]]
    inline transport::DisconnectReason close_reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_reason_;
    }

    // Empty until authenticated; fixed afterwards.
    [[nodiscard]]
    inline const UserId& user() const noexcept {
        return user_;
    }

    [[nodiscard]]
    inline std::size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

#ifdef RG_UNIT_TEST
    [[nodiscard]]
    inline bool is_pending(std::string_view id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.contains(id);
    }

    [[nodiscard]]
    inline Clock::time_point last_pong_for_test() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_pong_;
    }
#endif

private:
    std::shared_ptr<WS> ws_;
    config::Gateway cfg_;
    Hooks hooks_;

    // Reader context only
    parser::Router parser_;

    mutable std::mutex mutex_;
    std::mutex write_mutex_;

    transport::State state_{transport::State::Connecting};
    transport::DisconnectReason close_reason_{transport::DisconnectReason::None};
    UserId user_;

    Clock::time_point created_at_;
    Clock::time_point last_ping_;
    Clock::time_point last_pong_;

    PendingCalls pending_;

    lcr::sequence correlation_seq_;
    lcr::sequence ping_seq_;

private:

    inline bool send_(const std::string& frame) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        return ws_->send(frame);
    }

    [[nodiscard]]
    inline bool take_(const std::string& id) {
        PendingCall taken;
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.take(id, taken);
    }

    static inline void fail_(std::vector<PendingCall>& calls, Error error, std::string_view message) {
        for (auto& call : calls) {
            call.slot->fulfill(Reply::failure(error, std::string(message)));
        }
    }

    // Moves to the terminal state once. Fails whatever is still pending and
    // tells the owner.
    void finish_(transport::DisconnectReason reason) {
        std::vector<PendingCall> orphans;
        bool was_open = false;
        transport::State final_state;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (transport::is_terminal(state_)) {
                return;
            }
            if (state_ == transport::State::Closing) {
                reason = close_reason_;
            }
            else {
                close_reason_ = reason;
            }
            final_state = transport::is_graceful(reason) ? transport::State::Closed : transport::State::Disconnected;
            was_open = !user_.empty();
            state_ = final_state;
            orphans = pending_.take_all();
        }

        if (!orphans.empty()) {
            RG_INFO("[SESSION] Failing " << orphans.size() << " outstanding call(s) for user " << user_
                    << " with Disconnected");
            fail_(orphans, Error::Disconnected, "connection lost");
        }
        RG_INFO("[SESSION] Connection" << (user_.empty() ? std::string() : " for user " + user_)
                << " is " << to_string(final_state) << " (" << to_string(reason) << ")");

        if (was_open && hooks_.on_closed) {
            hooks_.on_closed(*this);
        }
    }

    // Logged, reported to the peer, then torn down.
    void violation_(const std::string& what) {
        RG_WARN("[SESSION] Protocol violation" << (user_.empty() ? std::string() : " from user " + user_)
                << ": " << what);
        send_(schema::ErrorNotice{"Protocol error: " + what, schema::error_code::PROTOCOL_VIOLATION}.to_json());
        close(transport::DisconnectReason::ProtocolError);
    }

    void handle_auth_(const schema::Auth& msg) {
        UserId user;
        const bool accepted = hooks_.authenticate && hooks_.authenticate(msg.token, user) && !user.empty();
        if (!accepted) {
            RG_WARN("[SESSION] Authentication failed");
            send_(schema::ErrorNotice{"Authentication failed", schema::error_code::AUTH_FAILED}.to_json());
            close(transport::DisconnectReason::AuthRejected);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != transport::State::Connecting) {
                return;
            }
            user_ = user;
            state_ = transport::State::Open;
            const auto now = Clock::now();
            last_pong_ = now;
            last_ping_ = now;
        }
        send_(schema::AuthSuccess{user_}.to_json());
        RG_INFO("[SESSION] User " << user_ << " authenticated");

        if (hooks_.on_open) {
            hooks_.on_open(*this);
        }
    }

    void handle_ping_(const schema::PingIn& msg) {
        schema::Pong pong;
        pong.id = msg.id;
        pong.server_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        if (!send_(pong.to_json())) {
            RG_WARN("[SESSION] Failed to write pong to user " << user_);
        }
    }

    void handle_pong_(const schema::Pong& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_pong_ = Clock::now();
        RG_TRACE("[SESSION] Pong " << lcr::to_string(msg.id) << " from user " << user_);
    }

    void handle_response_(schema::Response& msg) {
        PendingCall call;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            found = pending_.take(msg.request_id, call);
        }
        if (!found) {
            RG_WARN("[SESSION] Discarding response for unknown or expired request " << msg.request_id
                    << " from user " << user_);
            return;
        }

        if (msg.success) {
            Reply reply;
            reply.payload = std::move(msg.payload);
            call.slot->fulfill(std::move(reply));
        }
        else {
            RG_INFO("[SESSION] Request " << msg.request_id << " (" << call.request.endpoint
                    << ") failed in browser: " << msg.error);
            call.slot->fulfill(Reply::failure(Error::DelegateFailed, std::move(msg.error)));
        }
    }

    void handle_error_(const schema::ErrorNotice& msg) {
        RG_WARN("[SESSION] Client " << user_ << " reported error"
                << (msg.code.has() ? " " + std::to_string(msg.code.value()) : std::string())
                << ": " << msg.message);
    }
};

} // namespace relaygate::core::protocol
