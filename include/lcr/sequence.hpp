#pragma once

#include <atomic>
#include <cstdint>


namespace lcr {


// Monotonic sequence number generator, safe to share between threads.
// Values are never reused for the lifetime of the instance.
class alignas(64) sequence {
    std::atomic<uint64_t> next_seq_;
    char pad_[64 - sizeof(std::atomic<uint64_t>)];

public:
    explicit sequence(uint64_t start = 1) noexcept : next_seq_(start) {}
    sequence(const sequence&) = delete;
    sequence& operator=(const sequence&) = delete;

    // Return next sequence number and increment
    [[nodiscard]]
    inline uint64_t next() noexcept {
        return next_seq_.fetch_add(1, std::memory_order_relaxed);
    }
};
static_assert(sizeof(sequence) == 64, "sequence must be cache-line aligned");
static_assert(alignof(sequence) == 64, "sequence must be cache-line aligned");


} // namespace lcr
