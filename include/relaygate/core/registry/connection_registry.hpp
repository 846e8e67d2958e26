#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "relaygate/core/user_id.hpp"
#include "relaygate/core/protocol/session.hpp"
#include "relaygate/core/transport/concepts.hpp"
#include "relaygate/core/transport/state.hpp"
#include "lcr/log/logger.hpp"


namespace relaygate::core::registry {

/*
===============================================================================
ConnectionRegistry
===============================================================================

Purpose
-------
Maps each user to at most one live delegate connection.

Core Invariants
---------------
• At most one entry per user. Registering a second connection supersedes the
  first: it is closed (pending calls fail with Disconnected) and dropped.
• lookup() only hands out connections in State::Open.
• deregister() is compare-and-remove: a superseded connection closing late
  never evicts its successor.
• Sessions are closed outside the registry lock. Holds no per-call state.

===============================================================================
*/

template<transport::DelegateTransportConcept WS>
class ConnectionRegistry {
public:
    using SessionT = protocol::Session<WS>;
    using SessionPtr = std::shared_ptr<SessionT>;

    ConnectionRegistry() = default;
    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    void register_session(const UserId& user, SessionPtr session) {
        SessionPtr previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& slot = sessions_[user];
            previous = std::move(slot);
            slot = std::move(session);
        }
        if (previous) {
            RG_INFO("[REGISTRY] Superseding previous connection for user " << user);
            previous->close(transport::DisconnectReason::Superseded);
        }
        else {
            RG_DEBUG("[REGISTRY] Registered connection for user " << user);
        }
    }

    // Returns nullptr unless the user has an Open connection.
    [[nodiscard]]
    SessionPtr lookup(std::string_view user) const {
        SessionPtr session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(std::string(user));
            if (it == sessions_.end()) {
                return nullptr;
            }
            session = it->second;
        }
        if (session->state() != transport::State::Open) {
            return nullptr;
        }
        return session;
    }

    // Removes the entry only if it still points at 'session'.
    bool deregister(const UserId& user, const SessionT* session) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(user);
        if (it == sessions_.end() || it->second.get() != session) {
            RG_DEBUG("[REGISTRY] Ignoring stale deregistration for user " << user);
            return false;
        }
        sessions_.erase(it);
        RG_DEBUG("[REGISTRY] Deregistered connection for user " << user);
        return true;
    }

    [[nodiscard]]
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    [[nodiscard]]
    std::vector<UserId> users() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<UserId> out;
        out.reserve(sessions_.size());
        for (const auto& [user, _] : sessions_) {
            out.push_back(user);
        }
        return out;
    }

    // Snapshot of the registered sessions, for broadcast and maintenance.
    [[nodiscard]]
    std::vector<SessionPtr> sessions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SessionPtr> out;
        out.reserve(sessions_.size());
        for (const auto& [_, session] : sessions_) {
            out.push_back(session);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<UserId, SessionPtr> sessions_;
};

} // namespace relaygate::core::registry
