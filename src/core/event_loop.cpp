// ============================================================================
// PULSE TRADE BOT - Event Loop Implementation
// ============================================================================

#include "pulse/core/event_loop.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <csignal>
#include <exception>

namespace pulse::core {

namespace net = boost::asio;

struct EventLoop::Impl {
    Impl(const EventLoopConfig& config, std::shared_ptr<spdlog::logger> logger)
        : config_(config)
        , logger_(std::move(logger))
        , queue_(std::make_unique<EventQueue>())
        , drain_timer_(io_context_)
        , display_timer_(io_context_)
        , signals_(io_context_) {}

    size_t drain() {
        if (handler_ == nullptr) return 0;
        return queue_->drain(
            [this](const MarketEvent& event) {
                try {
                    handler_->on_market_event(event);
                } catch (const std::exception& e) {
                    handler_errors_.fetch_add(1, std::memory_order_relaxed);
                    logger_->error("Market event handler failed: {}", e.what());
                }
                events_processed_.fetch_add(1, std::memory_order_relaxed);
            },
            config_.max_drain_batch);
    }

    void schedule_drain() {
        drain_timer_.expires_after(config_.drain_interval);
        drain_timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec) return;
            drain();
            schedule_drain();
        });
    }

    void schedule_display() {
        display_timer_.expires_after(config_.display_interval);
        display_timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec) return;
            if (handler_ != nullptr) {
                try {
                    handler_->on_timer_event(TimerId::Display);
                } catch (const std::exception& e) {
                    handler_errors_.fetch_add(1, std::memory_order_relaxed);
                    logger_->error("Timer handler failed: {}", e.what());
                }
            }
            schedule_display();
        });
    }

    void arm_signals() {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
            if (ec) return;
            stop_signal_ = signal_number;
            logger_->info("Received signal {}, stopping event loop", signal_number);
            stop();
        });
    }

    void run() {
        io_context_.restart();
        if (stop_requested_) return;

        running_ = true;
        schedule_drain();
        if (config_.display_interval.count() > 0) {
            schedule_display();
        }
        if (config_.handle_signals) {
            arm_signals();
        }

        io_context_.run();

        boost::system::error_code ignored;
        signals_.cancel(ignored);
        signals_.clear(ignored);
        drain_timer_.cancel();
        display_timer_.cancel();
        running_ = false;
    }

    void stop() {
        stop_requested_ = true;
        io_context_.stop();
    }

    EventLoopConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<EventQueue> queue_;

    net::io_context io_context_{1};
    net::steady_timer drain_timer_;
    net::steady_timer display_timer_;
    net::signal_set signals_;

    IEventHandler* handler_ = nullptr;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<int> stop_signal_{0};
    std::atomic<uint64_t> events_processed_{0};
    std::atomic<uint64_t> handler_errors_{0};
};

// ============================================================================
// EventLoop Public Interface
// ============================================================================

EventLoop::EventLoop(const EventLoopConfig& config, std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_unique<Impl>(config, std::move(logger))) {}

EventLoop::~EventLoop() {
    stop();
}

EventQueue& EventLoop::ring_buffer() noexcept {
    return *impl_->queue_;
}

void EventLoop::set_handler(IEventHandler* handler) noexcept {
    impl_->handler_ = handler;
}

void EventLoop::run() {
    impl_->run();
}

void EventLoop::stop() {
    impl_->stop();
}

size_t EventLoop::poll() {
    return impl_->drain();
}

void EventLoop::post(std::function<void()> job) {
    net::post(impl_->io_context_, [this, job = std::move(job)]() {
        try {
            job();
        } catch (const std::exception& e) {
            impl_->handler_errors_.fetch_add(1, std::memory_order_relaxed);
            impl_->logger_->error("Posted job failed: {}", e.what());
        }
    });
}

bool EventLoop::is_running() const noexcept {
    return impl_->running_;
}

uint64_t EventLoop::events_processed() const noexcept {
    return impl_->events_processed_.load(std::memory_order_relaxed);
}

uint64_t EventLoop::handler_errors() const noexcept {
    return impl_->handler_errors_.load(std::memory_order_relaxed);
}

int EventLoop::stop_signal() const noexcept {
    return impl_->stop_signal_;
}

}  // namespace pulse::core
