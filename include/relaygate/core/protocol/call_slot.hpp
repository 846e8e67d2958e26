#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

#include "relaygate/core/protocol/reply.hpp"

namespace relaygate::core::protocol {

/*
===============================================================================
CallSlot
===============================================================================

Single-fulfillment result slot a delegated caller waits on.

Invariants
----------
• fulfill() succeeds at most once; later calls return false and do not
  change the stored reply.
• Waiting blocks only the calling thread. Fulfillment never blocks on the
  waiter (the connection read loop calls fulfill()).
===============================================================================
*/
class CallSlot {
public:
    using Clock = std::chrono::steady_clock;

    CallSlot() = default;
    CallSlot(const CallSlot&) = delete;
    CallSlot& operator=(const CallSlot&) = delete;

    inline bool fulfill(Reply reply) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) {
                return false;
            }
            reply_ = std::move(reply);
            done_ = true;
        }
        cv_.notify_all();
        return true;
    }

    // Returns false if the deadline passed first; 'out' is untouched then.
    [[nodiscard]]
    inline bool wait_until(Clock::time_point deadline, Reply& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_until(lock, deadline, [this] { return done_; })) {
            return false;
        }
        out = reply_;
        return true;
    }

    inline void wait(Reply& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
        out = reply_;
    }

    [[nodiscard]]
    inline bool fulfilled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return done_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool done_{false};
    Reply reply_;
};

} // namespace relaygate::core::protocol
