#pragma once

#include <atomic>
#include <cstddef>
#include <thread>

namespace phoenix {

    // Function: RingBuffer
    // Description: Bounded ring with many producers and a single consumer.
    //              Producers are serialised by a spin flag; the consumer side is lock-free.
    //              Size must be a power of 2; one slot is kept empty to tell full from empty.
    template<typename T, size_t Size>
    class RingBuffer {
        static_assert((Size & (Size - 1)) == 0, "Buffer size must be a power of 2");
        static constexpr size_t MASK = Size - 1;

        T buffer_[Size];

        alignas(64) std::atomic<size_t> head_{0};
        alignas(64) std::atomic<size_t> tail_{0};
        alignas(64) std::atomic_flag producer_lock_ = ATOMIC_FLAG_INIT;

    public:
        // Function: push
        // Description: Copies an item in. Safe from any thread.
        // Outputs: false when the ring is full; the item is not stored.
        bool push(const T& item) {
            while (producer_lock_.test_and_set(std::memory_order_acquire)) {
                std::this_thread::yield();
            }

            size_t current_head = head_.load(std::memory_order_relaxed);
            size_t next_head = (current_head + 1) & MASK;
            bool stored = false;

            if (next_head != tail_.load(std::memory_order_acquire)) {
                buffer_[current_head] = item;
                head_.store(next_head, std::memory_order_release);
                stored = true;
            }

            producer_lock_.clear(std::memory_order_release);
            return stored;
        }

        // Function: pop
        // Description: Moves the oldest item out. Consumer thread only.
        bool pop(T& item) {
            size_t current_tail = tail_.load(std::memory_order_relaxed);
            if (current_tail == head_.load(std::memory_order_acquire)) {
                return false;
            }

            item = buffer_[current_tail];
            tail_.store((current_tail + 1) & MASK, std::memory_order_release);
            return true;
        }

        bool empty() const {
            return tail_.load(std::memory_order_acquire) == head_.load(std::memory_order_acquire);
        }

        size_t size() const {
            return (head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire)) & MASK;
        }

        static constexpr size_t capacity() { return Size - 1; }
    };

}
