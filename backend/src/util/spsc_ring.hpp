#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <utility>

// Single-Producer / Single-Consumer ring buffer.
// - CapacityPow2 must be a power-of-two (e.g., 1024).
// - exactly one producer thread calls try_push,
//   exactly one consumer thread calls try_pop.
// Slots live on the heap so large rings of std::string-bearing records
// do not sit inside the owning object.
template <typename T, std::size_t CapacityPow2>
class SpscRing {
    static_assert(CapacityPow2 >= 2, "Capacity must be at least two");
    static_assert((CapacityPow2 & (CapacityPow2 - 1)) == 0, "Capacity must be power of two");

public:
    SpscRing() : slots_(std::make_unique<T[]>(CapacityPow2)) {}

    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    // Producer: false if full (caller decides policy)
    bool try_push(T&& v) {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & mask_;
        if (next == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        slots_[head] = std::move(v);
        head_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer: false if empty
    bool try_pop(T& out) {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            return false;
        }
        out = std::move(slots_[tail]);
        tail_.store((tail + 1) & mask_, std::memory_order_release);
        return true;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }
    std::size_t size() const {
        return (head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire)) & mask_;
    }
    std::size_t capacity() const { return CapacityPow2 - 1; } // one slot unused to disambiguate full/empty

private:
    static constexpr std::size_t mask_ = CapacityPow2 - 1;

    std::unique_ptr<T[]> slots_;
    alignas(64) std::atomic<std::size_t> head_{0}; // producer writes
    alignas(64) std::atomic<std::size_t> tail_{0}; // consumer writes
};
