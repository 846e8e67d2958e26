#pragma once

#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "relaygate/core/user_id.hpp"


namespace relaygate::core::protocol {

// Fixed token → user table. Thread-safe.
//
// Usable directly as Session::Hooks::authenticate.
class StaticTokenValidator {
public:
    StaticTokenValidator() = default;
    StaticTokenValidator(const StaticTokenValidator&) = delete;
    StaticTokenValidator& operator=(const StaticTokenValidator&) = delete;

    inline void add(std::string token, UserId user) {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens_[std::move(token)] = std::move(user);
    }

    inline bool revoke(std::string_view token) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tokens_.find(token);
        if (it == tokens_.end()) {
            return false;
        }
        tokens_.erase(it);
        return true;
    }

    [[nodiscard]]
    inline bool operator()(std::string_view token, UserId& user) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tokens_.find(token);
        if (it == tokens_.end()) {
            return false;
        }
        user = it->second;
        return true;
    }

    [[nodiscard]]
    inline std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tokens_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, UserId, std::less<>> tokens_;
};

} // namespace relaygate::core::protocol
