#pragma once
// ============================================================================
// PULSE TRADE BOT - Message Bus
// ============================================================================
// Producer-side facade over the event loop's ring buffer. Lives on the
// websocket I/O thread; publish() never blocks and never allocates.
// ============================================================================

#include "pulse/core/event_loop.hpp"

#include <atomic>
#include <cstdint>

namespace pulse::core {

class MessageBus {
public:
    explicit MessageBus(EventQueue& queue) noexcept : queue_(queue) {}

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    /// Returns false (and counts a drop) when the consumer has fallen behind
    bool publish(const MarketEvent& event) noexcept {
        if (queue_.try_push(event)) {
            published_.fetch_add(1, std::memory_order_relaxed);
            return true;
        }
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    [[nodiscard]] uint64_t events_published() const noexcept {
        return published_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t events_dropped() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] double drop_rate() const noexcept {
        const uint64_t published = events_published();
        const uint64_t dropped = events_dropped();
        const uint64_t total = published + dropped;
        return total > 0 ? static_cast<double>(dropped) / static_cast<double>(total) : 0.0;
    }

    [[nodiscard]] size_t queue_size() const noexcept { return queue_.size(); }

private:
    EventQueue& queue_;
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace pulse::core
