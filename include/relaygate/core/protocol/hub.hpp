#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "relaygate/core/config/gateway.hpp"
#include "relaygate/core/user_id.hpp"
#include "relaygate/core/protocol/session.hpp"
#include "relaygate/core/protocol/schema/notification.hpp"
#include "relaygate/core/registry/connection_registry.hpp"
#include "relaygate/core/transport/concepts.hpp"
#include "relaygate/core/transport/state.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"


namespace relaygate::core::protocol {

/*
===============================================================================
Hub
===============================================================================

Owns every accepted delegate connection from accept to teardown.

  attach(ws)  → new Session in Connecting, kept alive by the Hub
  auth ok     → Session registered under its user (superseding any older one)
  teardown    → Session deregistered (compare-and-remove), pruned on next tick

tick(now) drives Session::poll() for every live connection: pings, liveness,
auth timeouts and the expiry sweep. The owner calls it periodically.
===============================================================================
*/

struct HubStats {
    std::size_t connections{0};     // live sessions, authenticated or not
    std::size_t authenticated{0};   // users with a registered connection
    std::size_t pending_calls{0};   // delegated calls awaiting a response
};

template<transport::DelegateTransportConcept WS>
class Hub {
public:
    using SessionT = Session<WS>;
    using SessionPtr = std::shared_ptr<SessionT>;
    using Authenticator = std::function<bool(std::string_view, UserId&)>;

    Hub(const config::Gateway& cfg, Authenticator authenticate)
        : cfg_(cfg)
        , authenticate_(std::move(authenticate))
    {}

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    ~Hub() {
        close_all();
    }

    [[nodiscard]]
    inline registry::ConnectionRegistry<WS>& registry() noexcept {
        return registry_;
    }

    // Takes ownership of a freshly accepted channel.
    SessionPtr attach(std::shared_ptr<WS> ws, typename SessionT::Clock::time_point now = SessionT::Clock::now()) {
        typename SessionT::Hooks hooks;
        hooks.authenticate = authenticate_;
        hooks.on_open = [this](SessionT& s) {
            registry_.register_session(s.user(), s.shared_from_this());
        };
        hooks.on_closed = [this](SessionT& s) {
            registry_.deregister(s.user(), &s);
        };

        auto session = std::make_shared<SessionT>(std::move(ws), cfg_, std::move(hooks), now);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_.push_back(session);
        }
        session->start();
        return session;
    }

    void tick(typename SessionT::Clock::time_point now = SessionT::Clock::now()) {
        for (auto& session : live_()) {
            session->poll(now);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(
            std::remove_if(sessions_.begin(), sessions_.end(), [](const SessionPtr& s) {
                return transport::is_terminal(s->state());
            }),
            sessions_.end());
    }

    // Server push to one user. Returns false if the user has no Open
    // connection or the frame could not be written.
    bool notify(const UserId& user, lcr::optional<std::string> title, std::string message, std::string level = "info") {
        auto session = registry_.lookup(user);
        if (!session) {
            RG_DEBUG("[HUB] No open connection to notify for user " << user);
            return false;
        }
        schema::Notification n;
        n.title = std::move(title);
        n.message = std::move(message);
        n.level = std::move(level);
        return session->notify(n);
    }

    // Returns the number of users the notification was written to.
    std::size_t notify_all(lcr::optional<std::string> title, std::string message, std::string level = "info") {
        schema::Notification n;
        n.title = std::move(title);
        n.message = std::move(message);
        n.level = std::move(level);

        std::size_t delivered = 0;
        for (auto& session : registry_.sessions()) {
            if (session->notify(n)) {
                ++delivered;
            }
        }
        RG_DEBUG("[HUB] Broadcast notification delivered to " << delivered << " user(s)");
        return delivered;
    }

    [[nodiscard]]
    HubStats stats() const {
        HubStats out;
        for (auto& session : live_()) {
            if (transport::is_terminal(session->state())) {
                continue;
            }
            ++out.connections;
            out.pending_calls += session->pending_count();
        }
        out.authenticated = registry_.size();
        return out;
    }

    void close_all() {
        for (auto& session : live_()) {
            session->close(transport::DisconnectReason::LocalClose);
        }
    }

private:
    config::Gateway cfg_;
    Authenticator authenticate_;
    registry::ConnectionRegistry<WS> registry_;

    mutable std::mutex mutex_;
    std::vector<SessionPtr> sessions_;

private:
    [[nodiscard]]
    std::vector<SessionPtr> live_() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_;
    }
};

} // namespace relaygate::core::protocol
