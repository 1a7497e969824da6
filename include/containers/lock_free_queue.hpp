#pragma once

#include "common/utils.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <new>
#include <type_traits>

namespace canonical {

/// Lock-free Single-Producer Single-Consumer (SPSC) ring buffer.
/// Capacity MUST be a power of 2 for efficient index masking.
/// Producer publishes with release on tail, consumer observes with acquire.
template<typename T, size_t Capacity>
class LockFreeRingBuffer {
    static_assert(is_power_of_two(Capacity), "Capacity must be a power of 2");
    static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");

public:
    LockFreeRingBuffer()
        : buffer_(new T[Capacity]{}) {}

    /// Producer: returns false if full.
    bool try_push(const T& item) noexcept {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t next = (tail + 1) & MASK;
        if (next == head_.load(std::memory_order_acquire)) {
            return false;
        }
        buffer_[tail] = item;
        tail_.store(next, std::memory_order_release);
        return true;
    }

    /// Consumer: returns false if empty.
    bool try_pop(T& item) noexcept {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        item = buffer_[head];
        head_.store((head + 1) & MASK, std::memory_order_release);
        return true;
    }

    /// Consumer: pop everything currently visible, returns the number drained.
    template<typename Fn>
    size_t drain(Fn&& fn) {
        size_t drained = 0;
        T item;
        while (try_pop(item)) {
            fn(item);
            ++drained;
        }
        return drained;
    }

    size_t size() const noexcept {
        return (tail_.load(std::memory_order_acquire) - head_.load(std::memory_order_acquire)) & MASK;
    }

    bool empty() const noexcept {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    static constexpr size_t capacity() noexcept { return Capacity - 1; }

private:
    static constexpr size_t MASK = Capacity - 1;

    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};

    std::unique_ptr<T[]> buffer_;
};

} // namespace canonical
