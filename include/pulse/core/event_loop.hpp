#pragma once
// ============================================================================
// PULSE TRADE BOT - Event Loop (Reactor)
// ============================================================================
// Single-threaded Asio reactor that owns the market event queue:
//
//   [WS Thread] --publish--> [SPSC Ring Buffer] --drain--> [EventLoop]
//                                                              |
//                                                        IEventHandler
//
// Strategy state is only ever touched from the thread calling run().
// SIGINT / SIGTERM are handled here and stop the loop.
// ============================================================================

#include "pulse/core/market_event.hpp"
#include "pulse/core/ring_buffer.hpp"

#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace pulse::core {

inline constexpr size_t EVENT_QUEUE_CAPACITY = 8192;

using EventQueue = SPSCRingBuffer<MarketEvent, EVENT_QUEUE_CAPACITY>;

enum class TimerId : uint8_t {
    Display = 0,
};

// ============================================================================
// Event Handler Interface
// ============================================================================

class IEventHandler {
public:
    virtual ~IEventHandler() = default;

    /// Called once per drained market event, in queue order
    virtual void on_market_event(const MarketEvent& event) = 0;

    /// Called on each periodic timer tick
    virtual void on_timer_event(TimerId id) = 0;
};

// ============================================================================
// Event Loop Configuration
// ============================================================================

struct EventLoopConfig {
    std::chrono::milliseconds drain_interval{5};
    std::chrono::milliseconds display_interval{1000};
    size_t max_drain_batch = 1024;
    bool handle_signals = true;
};

// ============================================================================
// Event Loop
// ============================================================================

class EventLoop {
public:
    EventLoop(const EventLoopConfig& config, std::shared_ptr<spdlog::logger> logger);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Queue written by the producer side (see MessageBus)
    [[nodiscard]] EventQueue& ring_buffer() noexcept;

    /// Handler must outlive the loop
    void set_handler(IEventHandler* handler) noexcept;

    /// Block on the reactor until stop() or a termination signal
    void run();

    /// Thread-safe, idempotent
    void stop();

    /// Drain the queue once on the calling thread. Returns events handled.
    size_t poll();

    /// Run `job` on the loop thread
    void post(std::function<void()> job);

    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] uint64_t events_processed() const noexcept;
    [[nodiscard]] uint64_t handler_errors() const noexcept;

    /// Signal number that stopped the loop, 0 if none
    [[nodiscard]] int stop_signal() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace pulse::core
