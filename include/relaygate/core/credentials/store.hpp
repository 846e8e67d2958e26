#pragma once

#include <concepts>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "relaygate/core/credentials/snapshot.hpp"
#include "relaygate/core/user_id.hpp"

namespace relaygate::core::credentials {

// ===============================================================
// Credential Store Adapter port
// ===============================================================
//
// lookup() copies the current snapshot for 'user' into 'out' and returns
// true, or returns false when nothing is stored. Implementations must be
// callable concurrently from many routing threads.
template<class S>
concept CredentialStoreConcept =
    requires(const S& store, const UserId& user, CredentialSnapshot& out) {
        { store.lookup(user, out) } -> std::same_as<bool>;
    };


// Process-local store. Persistence lives outside the gateway; this adapter
// is filled at startup (load_json / load_file) or by the embedding application.
class InMemoryCredentialStore {
public:
    InMemoryCredentialStore() = default;
    InMemoryCredentialStore(const InMemoryCredentialStore&) = delete;
    InMemoryCredentialStore& operator=(const InMemoryCredentialStore&) = delete;

    [[nodiscard]]
    bool lookup(const UserId& user, CredentialSnapshot& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = snapshots_.find(user);
        if (it == snapshots_.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    void put(const UserId& user, CredentialSnapshot snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_[user] = std::move(snapshot);
    }

    bool erase(const UserId& user) {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_.erase(user) > 0;
    }

    [[nodiscard]]
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_.size();
    }

    // Loads {"<user>": {"csrf_token": "...", "cookies": {"<name>": "<value>", ...}}, ...}.
    // Entries are merged over existing ones. On a malformed document nothing
    // is applied and false is returned.
    [[nodiscard]]
    bool load_json(std::string_view json);

    [[nodiscard]]
    bool load_file(const std::string& path);

private:
    mutable std::mutex mutex_;
    std::unordered_map<UserId, CredentialSnapshot> snapshots_;
};
static_assert(CredentialStoreConcept<InMemoryCredentialStore>);

} // namespace relaygate::core::credentials
