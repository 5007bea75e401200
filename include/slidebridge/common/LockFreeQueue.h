#pragma once
// =============================================================================
// SlideBridge - Lock-Free Queue
// SPSC (single-producer, single-consumer) ring buffer.
// Requests: host thread -> worker thread. Responses: worker thread -> host.
// =============================================================================

#include <atomic>
#include <array>
#include <cstddef>
#include <optional>
#include <utility>

namespace SlideBridge
{

template <typename T, size_t Capacity = 64>
class LockFreeQueue
{
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

public:
    bool push(T item)
    {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t next = (head + 1) & (Capacity - 1);
        if (next == tail_.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = std::move(item);
        head_.store(next, std::memory_order_release);
        return true;
    }

    std::optional<T> pop()
    {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire))
            return std::nullopt; // empty
        T item = std::move(buffer_[tail]);
        buffer_[tail] = T{};
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return item;
    }

    bool empty() const
    {
        return tail_.load(std::memory_order_acquire) == head_.load(std::memory_order_acquire);
    }

private:
    std::array<T, Capacity> buffer_{};
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
};

} // namespace SlideBridge
