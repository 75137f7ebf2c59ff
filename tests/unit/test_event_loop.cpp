// ============================================================================
// PULSE TRADE BOT - Event Loop Unit Tests
// ============================================================================

#include "pulse/core/event_loop.hpp"
#include "pulse/core/message_bus.hpp"
#include "pulse/utils/logger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace pulse;
using namespace pulse::core;
using namespace std::chrono_literals;

namespace {

class RecordingHandler : public IEventHandler {
public:
    void on_market_event(const MarketEvent& event) override {
        if (throw_on_next) {
            throw_on_next = false;
            throw std::runtime_error("handler exploded");
        }
        times.push_back(event_time_ns(event));
    }

    void on_timer_event(TimerId id) override {
        if (id == TimerId::Display) {
            ++display_ticks;
        }
    }

    std::vector<uint64_t> times;
    std::atomic<int> display_ticks{0};
    bool throw_on_next = false;
};

MarketEvent trade_at(uint64_t ns) {
    return TradeExecution{100.0, 1.0, Side::Buy, ns};
}

}  // namespace

class EventLoopTest : public ::testing::Test {
protected:
    EventLoopTest() : loop(make_config(), utils::make_null_logger()), bus(loop.ring_buffer()) {}

    static EventLoopConfig make_config() {
        EventLoopConfig config;
        config.handle_signals = false;
        config.drain_interval = 1ms;
        config.display_interval = 10ms;
        return config;
    }

    RecordingHandler handler;
    EventLoop loop;
    MessageBus bus;
};

TEST_F(EventLoopTest, PollWithoutHandlerLeavesQueue) {
    ASSERT_TRUE(bus.publish(trade_at(1)));
    EXPECT_EQ(loop.poll(), 0u);
    EXPECT_EQ(bus.queue_size(), 1u);
}

TEST_F(EventLoopTest, PollDeliversInOrder) {
    loop.set_handler(&handler);
    for (uint64_t i = 1; i <= 5; ++i) {
        ASSERT_TRUE(bus.publish(trade_at(i)));
    }

    EXPECT_EQ(loop.poll(), 5u);
    EXPECT_EQ(handler.times, (std::vector<uint64_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(loop.events_processed(), 5u);
    EXPECT_EQ(bus.events_published(), 5u);
}

TEST_F(EventLoopTest, HandlerErrorsAreCountedNotFatal) {
    loop.set_handler(&handler);
    handler.throw_on_next = true;
    ASSERT_TRUE(bus.publish(trade_at(1)));
    ASSERT_TRUE(bus.publish(trade_at(2)));

    EXPECT_EQ(loop.poll(), 2u);
    EXPECT_EQ(loop.handler_errors(), 1u);
    EXPECT_EQ(handler.times, (std::vector<uint64_t>{2}));
}

TEST_F(EventLoopTest, FullQueueCountsDrops) {
    size_t accepted = 0;
    for (size_t i = 0; i < EVENT_QUEUE_CAPACITY + 10; ++i) {
        if (bus.publish(trade_at(i))) ++accepted;
    }

    EXPECT_EQ(accepted, EVENT_QUEUE_CAPACITY - 1);
    EXPECT_EQ(bus.events_dropped(), 11u);
    EXPECT_GT(bus.drop_rate(), 0.0);
}

TEST_F(EventLoopTest, RunDrainsAndTicksUntilStopped) {
    loop.set_handler(&handler);
    std::thread runner([this] { loop.run(); });

    for (uint64_t i = 1; i <= 3; ++i) {
        ASSERT_TRUE(bus.publish(trade_at(i)));
    }

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while ((loop.events_processed() < 3 || handler.display_ticks.load() < 2) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }

    loop.stop();
    runner.join();

    EXPECT_EQ(loop.events_processed(), 3u);
    EXPECT_GE(handler.display_ticks.load(), 2);
    EXPECT_FALSE(loop.is_running());
    EXPECT_EQ(loop.stop_signal(), 0);
}

TEST_F(EventLoopTest, PostedJobsRunOnLoopThread) {
    std::thread::id job_thread;
    std::thread runner([this] { loop.run(); });
    const auto runner_id = runner.get_id();

    loop.post([&] {
        job_thread = std::this_thread::get_id();
        loop.stop();
    });
    runner.join();

    EXPECT_EQ(job_thread, runner_id);
}

TEST_F(EventLoopTest, PostedJobErrorsAreCounted) {
    loop.post([] { throw std::runtime_error("bad job"); });
    loop.post([this] { loop.stop(); });
    loop.run();

    EXPECT_EQ(loop.handler_errors(), 1u);
}

TEST_F(EventLoopTest, StopBeforeRunReturnsImmediately) {
    loop.stop();
    loop.run();
    EXPECT_FALSE(loop.is_running());
}
