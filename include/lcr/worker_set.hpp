#pragma once

#include <atomic>
#include <cstddef>
#include <list>
#include <memory>
#include <thread>
#include <utility>


namespace lcr {


// Bounded set of short-lived worker threads owned by a single thread.
// Finished workers are joined and released by reap(), so the set never holds
// more than `capacity` threads, running or done.
//
// Not thread-safe: spawn/reap/join_all must be called from the owning thread.
class worker_set {
    struct worker {
        std::atomic<bool> done{false};
        std::thread thread;
    };

    std::list<std::unique_ptr<worker>> workers_;
    std::size_t capacity_;

public:
    explicit worker_set(std::size_t capacity) noexcept : capacity_(capacity == 0 ? 1 : capacity) {}
    worker_set(const worker_set&) = delete;
    worker_set& operator=(const worker_set&) = delete;

    ~worker_set() {
        join_all();
    }

    // Run fn on a new thread. Returns false when `capacity` workers are
    // still running after reaping the finished ones.
    template <class Fn>
    [[nodiscard]]
    bool spawn(Fn&& fn) {
        reap();
        if (workers_.size() >= capacity_) {
            return false;
        }
        auto w = std::make_unique<worker>();
        worker* raw = w.get();
        raw->thread = std::thread([raw, fn = std::forward<Fn>(fn)]() mutable {
            fn();
            raw->done.store(true, std::memory_order_release);
        });
        workers_.push_back(std::move(w));
        return true;
    }

    // Join every finished worker. Returns how many were released.
    inline std::size_t reap() {
        std::size_t n = 0;
        for (auto it = workers_.begin(); it != workers_.end();) {
            if ((*it)->done.load(std::memory_order_acquire)) {
                (*it)->thread.join();
                it = workers_.erase(it);
                ++n;
            }
            else {
                ++it;
            }
        }
        return n;
    }

    inline void join_all() {
        for (auto& w : workers_) {
            if (w->thread.joinable()) {
                w->thread.join();
            }
        }
        workers_.clear();
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept { return workers_.size(); }

    [[nodiscard]]
    inline std::size_t capacity() const noexcept { return capacity_; }
};


} // namespace lcr
