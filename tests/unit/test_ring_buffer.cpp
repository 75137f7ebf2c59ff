// ============================================================================
// PULSE TRADE BOT - Ring Buffer Unit Tests
// ============================================================================

#include "pulse/core/market_event.hpp"
#include "pulse/core/ring_buffer.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace pulse;

// Test data structure
struct TestMessage {
    int id;
    double value;
};

// ============================================================================
// SPSC Ring Buffer Tests
// ============================================================================

class SPSCRingBufferTest : public ::testing::Test {
protected:
    static constexpr size_t CAPACITY = 64;
    SPSCRingBuffer<TestMessage, CAPACITY> buffer;
};

TEST_F(SPSCRingBufferTest, InitiallyEmpty) {
    EXPECT_TRUE(buffer.empty());
    EXPECT_FALSE(buffer.full());
    EXPECT_EQ(buffer.size(), 0);
    EXPECT_EQ(buffer.capacity(), CAPACITY - 1);
}

TEST_F(SPSCRingBufferTest, PushAndPop) {
    TestMessage msg{1, 3.14};

    EXPECT_TRUE(buffer.try_push(msg));
    EXPECT_FALSE(buffer.empty());
    EXPECT_EQ(buffer.size(), 1);

    auto result = buffer.try_pop();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->id, 1);
    EXPECT_DOUBLE_EQ(result->value, 3.14);
    EXPECT_TRUE(buffer.empty());
}

TEST_F(SPSCRingBufferTest, PopEmptyReturnsNothing) {
    EXPECT_FALSE(buffer.try_pop().has_value());
}

TEST_F(SPSCRingBufferTest, FIFO) {
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(buffer.try_push({i, static_cast<double>(i)}));
    }

    for (int i = 0; i < 10; ++i) {
        auto result = buffer.try_pop();
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->id, i);
    }
}

TEST_F(SPSCRingBufferTest, Full) {
    // Fill the buffer (capacity - 1 elements)
    for (size_t i = 0; i < CAPACITY - 1; ++i) {
        EXPECT_TRUE(buffer.try_push({static_cast<int>(i), 0.0}));
    }

    EXPECT_TRUE(buffer.full());
    EXPECT_FALSE(buffer.try_push({999, 0.0}));
}

TEST_F(SPSCRingBufferTest, Wrap) {
    int next_expected = 0;
    int next_id = 0;
    for (int round = 0; round < 3; ++round) {
        for (size_t i = 0; i < CAPACITY / 2; ++i) {
            ASSERT_TRUE(buffer.try_push({next_id++, 0.0}));
        }
        for (size_t i = 0; i < CAPACITY / 2; ++i) {
            auto item = buffer.try_pop();
            ASSERT_TRUE(item.has_value());
            EXPECT_EQ(item->id, next_expected++);
        }
    }

    EXPECT_TRUE(buffer.empty());
}

TEST_F(SPSCRingBufferTest, DrainRespectsBatchLimit) {
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(buffer.try_push({i, 0.0}));
    }

    std::vector<int> seen;
    const size_t drained = buffer.drain([&seen](const TestMessage& m) { seen.push_back(m.id); }, 4);

    EXPECT_EQ(drained, 4u);
    EXPECT_EQ(seen, (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(buffer.size(), 6u);

    EXPECT_EQ(buffer.drain([&seen](const TestMessage& m) { seen.push_back(m.id); }), 6u);
    EXPECT_TRUE(buffer.empty());
}

TEST(SPSCRingBufferThreadTest, ProducerConsumerKeepsOrder) {
    SPSCRingBuffer<TestMessage, 1024> buffer;
    constexpr int COUNT = 100000;

    std::thread producer([&buffer] {
        for (int i = 0; i < COUNT; ++i) {
            while (!buffer.try_push({i, 0.0})) {
                std::this_thread::yield();
            }
        }
    });

    int expected = 0;
    while (expected < COUNT) {
        auto item = buffer.try_pop();
        if (!item) {
            std::this_thread::yield();
            continue;
        }
        ASSERT_EQ(item->id, expected);
        ++expected;
    }
    producer.join();
    EXPECT_TRUE(buffer.empty());
}

TEST(SPSCRingBufferEventTest, CarriesMarketEvents) {
    SPSCRingBuffer<MarketEvent, 8> buffer;
    ASSERT_TRUE(buffer.try_push(TradeExecution{101.5, 2.0, Side::Sell, 42}));

    auto item = buffer.try_pop();
    ASSERT_TRUE(item.has_value());
    const auto* trade = std::get_if<TradeExecution>(&*item);
    ASSERT_NE(trade, nullptr);
    EXPECT_DOUBLE_EQ(trade->price, 101.5);
    EXPECT_EQ(trade->side, Side::Sell);
    EXPECT_EQ(trade->event_time_ns, 42u);
}
