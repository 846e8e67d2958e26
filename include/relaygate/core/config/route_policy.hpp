#pragma once

#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "relaygate/core/route.hpp"
#include "relaygate/core/user_id.hpp"
#include "lcr/optional.hpp"


namespace relaygate::core::config {

// Per-user route table with a process-wide fallback.
//
// The route is data the operator sets; nothing here looks at credentials.
// Thread-safe.
class RoutePolicy {
public:
    explicit RoutePolicy(Route fallback = Route::Delegated) noexcept
        : fallback_(fallback)
    {}

    RoutePolicy(const RoutePolicy&) = delete;
    RoutePolicy& operator=(const RoutePolicy&) = delete;

    inline void set(const UserId& user, Route route) {
        std::lock_guard<std::mutex> lock(mutex_);
        overrides_[user] = route;
    }

    inline bool clear(std::string_view user) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = overrides_.find(user);
        if (it == overrides_.end()) {
            return false;
        }
        overrides_.erase(it);
        return true;
    }

    inline void set_fallback(Route route) {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_ = route;
    }

    // Explicit per-call choice wins, then the user's override, then the fallback.
    [[nodiscard]]
    inline Route resolve(std::string_view user, const lcr::optional<Route>& explicit_route = {}) const {
        if (explicit_route.has()) {
            return explicit_route.value();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = overrides_.find(user);
        return it != overrides_.end() ? it->second : fallback_;
    }

    [[nodiscard]]
    inline std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return overrides_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<UserId, Route, std::less<>> overrides_;
    Route fallback_;
};

} // namespace relaygate::core::config
