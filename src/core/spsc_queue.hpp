// core/spsc_queue.hpp
// Lock-free single-producer single-consumer queue with compile-time capacity
//
// Used for the socket-owner -> flow-worker hand-off: the socket owner is the
// only producer of a flow's queue, the flow worker its only consumer.
// Capacity must be a power of 2; one slot is reserved to distinguish
// full from empty, so at most Capacity - 1 items are queued.
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>

// Platform-specific cache line size
#ifndef CACHE_LINE_SIZE
#if defined(__aarch64__) && defined(__APPLE__)
#define CACHE_LINE_SIZE 128  // Apple Silicon M1/M2/M3/M4
#else
#define CACHE_LINE_SIZE 64   // x86/x64, other ARM
#endif
#endif

namespace udpperf {

// Compile-time check: Capacity must be power of 2
template<size_t N>
struct IsPowerOfTwo {
    static constexpr bool value = (N != 0) && ((N & (N - 1)) == 0);
};

template<typename T, size_t Capacity>
struct SpscQueue {
    static_assert(IsPowerOfTwo<Capacity>::value, "Capacity must be a power of 2");
    static_assert(std::is_trivially_copyable_v<T>, "SpscQueue items must be trivially copyable");

    static constexpr size_t MASK = Capacity - 1;

    SpscQueue()
        : slots_(new T[Capacity])
        , write_pos_(0)
        , read_pos_(0)
    {}

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    // Producer side. Returns false when full (item not queued).
    bool try_push(const T& item) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t next = (w + 1) & MASK;
        if (next == read_pos_.load(std::memory_order_acquire)) {
            return false;
        }
        slots_[w] = item;
        write_pos_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side. Returns false when empty.
    bool try_pop(T& out) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        if (r == write_pos_.load(std::memory_order_acquire)) {
            return false;
        }
        out = slots_[r];
        read_pos_.store((r + 1) & MASK, std::memory_order_release);
        return true;
    }

    // Approximate when called from a thread other than both ends
    size_t size() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return (w - r) & MASK;
    }

    bool empty() const {
        return size() == 0;
    }

    static constexpr size_t capacity() {
        return Capacity - 1;
    }

private:
    std::unique_ptr<T[]> slots_;
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> write_pos_;  // Producer-owned
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> read_pos_;   // Consumer-owned
};

} // namespace udpperf
