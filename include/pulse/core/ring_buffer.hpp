#pragma once
// ============================================================================
// PULSE TRADE BOT - Lock-Free SPSC Ring Buffer
// ============================================================================
// Bounded channel between the websocket I/O thread (producer) and the event
// loop thread (consumer). The producer never blocks: a full buffer rejects
// the push and the caller counts the drop.
// ============================================================================

#include <array>
#include <atomic>
#include <bit>
#include <concepts>
#include <cstddef>
#include <new>
#include <optional>
#include <type_traits>

namespace pulse {

// ============================================================================
// Cache Line Constants
// ============================================================================

#ifdef __cpp_lib_hardware_interference_size
    inline constexpr size_t CACHE_LINE_SIZE = std::hardware_destructive_interference_size;
#else
    inline constexpr size_t CACHE_LINE_SIZE = 64;
#endif

template <typename T>
concept RingBufferElement = std::is_trivially_copyable_v<T> && std::is_trivially_destructible_v<T>;

// ============================================================================
// SPSC Ring Buffer (Single Producer, Single Consumer)
// ============================================================================
// - head/tail on separate cache lines
// - power-of-2 capacity, index wrap by mask
// - one slot kept empty to tell full from empty

template <RingBufferElement T, size_t Capacity>
class SPSCRingBuffer {
public:
    static_assert(std::has_single_bit(Capacity), "Capacity must be a power of 2");
    static_assert(Capacity >= 2, "Capacity must be at least 2");

    static constexpr size_t MASK = Capacity - 1;

    SPSCRingBuffer() : head_(0), tail_(0) {}

    SPSCRingBuffer(const SPSCRingBuffer&) = delete;
    SPSCRingBuffer& operator=(const SPSCRingBuffer&) = delete;

    /// Try to push an element (producer thread only)
    /// Returns false if the buffer is full
    [[nodiscard]] bool try_push(const T& item) noexcept {
        const size_t current_head = head_.load(std::memory_order_relaxed);
        const size_t next_head = (current_head + 1) & MASK;

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false;
        }

        buffer_[current_head] = item;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    /// Try to pop an element (consumer thread only)
    [[nodiscard]] std::optional<T> try_pop() noexcept {
        const size_t current_tail = tail_.load(std::memory_order_relaxed);

        if (current_tail == head_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }

        T item = buffer_[current_tail];
        tail_.store((current_tail + 1) & MASK, std::memory_order_release);
        return item;
    }

    /// Pop up to `max_items` elements and hand each to `fn` (consumer thread only).
    /// Returns the number of elements consumed.
    template <typename Fn>
        requires std::invocable<Fn&, const T&>
    size_t drain(Fn&& fn, size_t max_items = Capacity) {
        size_t count = 0;
        while (count < max_items) {
            auto item = try_pop();
            if (!item) break;
            fn(*item);
            ++count;
        }
        return count;
    }

    [[nodiscard]] bool empty() const noexcept {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool full() const noexcept {
        const size_t next_head = (head_.load(std::memory_order_acquire) + 1) & MASK;
        return next_head == tail_.load(std::memory_order_acquire);
    }

    /// Approximate, may be stale
    [[nodiscard]] size_t size() const noexcept {
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail) & MASK;
    }

    [[nodiscard]] constexpr size_t capacity() const noexcept { return Capacity - 1; }

private:
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> head_;
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> tail_;
    alignas(CACHE_LINE_SIZE) std::array<T, Capacity> buffer_{};
};

}  // namespace pulse
