#ifndef CIRCULAR_BUFFER_HPP
#define CIRCULAR_BUFFER_HPP

#include <array>
#include <atomic>
#include <cstddef>

// Fixed-capacity, header-only circular buffer.
// - No dynamic allocation (storage is embedded).
// - One producer task and one consumer task may use it concurrently: only
//   push() writes head_index, only pop() writes tail_index.
// - push/pop are non-blocking and return false on full/empty.
template<typename T, std::size_t Capacity>
class CircularBuffer {
public:
    static_assert(Capacity > 0, "CircularBuffer capacity must be greater than zero");

    CircularBuffer() : storage{}, head_index(0), tail_index(0) {}

    bool push(const T& value) {
        const std::size_t head = head_index.load(std::memory_order_relaxed);
        const std::size_t next = advance(head);
        if (next == tail_index.load(std::memory_order_acquire)) {
            return false;
        }
        storage[head] = value;
        head_index.store(next, std::memory_order_release);
        return true;
    }

    bool pop(T& out_value) {
        const std::size_t tail = tail_index.load(std::memory_order_relaxed);
        if (tail == head_index.load(std::memory_order_acquire)) {
            return false;
        }
        out_value = storage[tail];
        tail_index.store(advance(tail), std::memory_order_release);
        return true;
    }

    std::size_t getCount() const {
        const std::size_t head = head_index.load(std::memory_order_acquire);
        const std::size_t tail = tail_index.load(std::memory_order_acquire);
        return (head + SLOTS - tail) % SLOTS;
    }

private:
    // One slot stays empty to tell full from empty
    static constexpr std::size_t SLOTS = Capacity + 1U;

    static std::size_t advance(std::size_t index) {
        return (index + 1U) % SLOTS;
    }

    std::array<T, SLOTS> storage;
    std::atomic<std::size_t> head_index;
    std::atomic<std::size_t> tail_index;
};

#endif // CIRCULAR_BUFFER_HPP
