#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "relaygate/core/protocol/call_slot.hpp"
#include "relaygate/core/request/logical_request.hpp"


namespace relaygate::core::protocol {

struct PendingCall {
    std::string correlation_id;
    request::LogicalRequest request;
    CallSlot::Clock::time_point deadline;
    std::shared_ptr<CallSlot> slot;
};

/*
===============================================================================
PendingCalls
===============================================================================

Purpose
-------
Table of delegated calls awaiting a response on one connection.

  correlation id -> PendingCall

Core Invariants
---------------
• A correlation id appears at most once.
• Every removal hands the entry to exactly one caller (take / take_expired /
  take_all). Whoever took it owns the right to fulfill its slot.
• Not thread-safe: the owning session serializes all access under its lock.

===============================================================================
*/

class PendingCalls {
public:
    using Clock = CallSlot::Clock;

    PendingCalls() = default;
    PendingCalls(const PendingCalls&) = delete;
    PendingCalls& operator=(const PendingCalls&) = delete;

    // Returns false (and stores nothing) if the id is already pending.
    [[nodiscard]]
    inline bool insert(PendingCall call) {
        auto id = call.correlation_id;
        return calls_.emplace(std::move(id), std::move(call)).second;
    }

    // Removes the entry for 'id' into 'out'. Returns false if absent.
    [[nodiscard]]
    inline bool take(std::string_view id, PendingCall& out) {
        auto it = calls_.find(std::string(id));
        if (it == calls_.end()) {
            return false;
        }
        out = std::move(it->second);
        calls_.erase(it);
        return true;
    }

    // Removes every entry whose deadline is at or before 'now'.
    [[nodiscard]]
    inline std::vector<PendingCall> take_expired(Clock::time_point now) {
        std::vector<PendingCall> out;
        for (auto it = calls_.begin(); it != calls_.end();) {
            if (it->second.deadline <= now) {
                out.push_back(std::move(it->second));
                it = calls_.erase(it);
            }
            else {
                ++it;
            }
        }
        return out;
    }

    [[nodiscard]]
    inline std::vector<PendingCall> take_all() {
        std::vector<PendingCall> out;
        out.reserve(calls_.size());
        for (auto& [_, call] : calls_) {
            out.push_back(std::move(call));
        }
        calls_.clear();
        return out;
    }

    // ------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------

    [[nodiscard]]
    inline bool contains(std::string_view id) const {
        return calls_.find(std::string(id)) != calls_.end();
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return calls_.empty();
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return calls_.size();
    }

private:
    std::unordered_map<std::string, PendingCall> calls_;
};

} // namespace relaygate::core::protocol
