// ============================================================================
// PULSE TRADE BOT - RSI Unit Tests
// ============================================================================

#include "pulse/strategy/indicators/rsi.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace pulse::strategy;

class RSITest : public ::testing::Test {
protected:
    RSI14 rsi;

    const std::vector<double> prices = {
        44.0, 44.34, 44.09, 43.61, 44.33,
        44.83, 45.10, 45.42, 45.84, 46.08,
        45.89, 46.03, 45.61, 46.28, 46.28,
        46.00, 46.03, 46.41, 46.22, 45.64
    };
};

TEST_F(RSITest, InitiallyNotReady) {
    EXPECT_FALSE(rsi.is_ready());
    EXPECT_DOUBLE_EQ(rsi.value(), 50.0);
}

TEST_F(RSITest, ReadyAfterEnoughData) {
    // RSI14 needs 15 data points to be ready
    for (int i = 0; i < 14; ++i) {
        rsi.update(100.0 + i);
    }
    EXPECT_FALSE(rsi.is_ready());
    EXPECT_DOUBLE_EQ(rsi.value(), 50.0);

    rsi.update(114.0);
    EXPECT_TRUE(rsi.is_ready());
    EXPECT_EQ(rsi.period(), 15u);
}

TEST_F(RSITest, KnownSeries) {
    for (double price : prices) {
        rsi.update(price);
    }

    ASSERT_TRUE(rsi.is_ready());
    EXPECT_NEAR(rsi.value(), 66.68092230202525, 1e-9);
}

TEST_F(RSITest, KnownSeriesFirstReadyValue) {
    for (size_t i = 0; i < 15; ++i) {
        rsi.update(prices[i]);
    }
    EXPECT_NEAR(rsi.value(), 82.74384384802532, 1e-9);
}

TEST_F(RSITest, AllGainsIsHundred) {
    double price = 100.0;
    for (int i = 0; i < 20; ++i) {
        price += 2.0;
        rsi.update(price);
    }

    ASSERT_TRUE(rsi.is_ready());
    EXPECT_DOUBLE_EQ(rsi.value(), 100.0);
    EXPECT_TRUE(rsi.is_above(60.0));
    EXPECT_FALSE(rsi.is_below(40.0));
}

TEST_F(RSITest, AllLossesIsZero) {
    double price = 200.0;
    for (int i = 0; i < 20; ++i) {
        price -= 2.0;
        rsi.update(price);
    }

    ASSERT_TRUE(rsi.is_ready());
    EXPECT_DOUBLE_EQ(rsi.value(), 0.0);
    EXPECT_TRUE(rsi.is_below(40.0));
}

TEST_F(RSITest, FlatSeriesIsHundred) {
    // No losses at all, so the ratio is undefined and reads as maximum
    for (int i = 0; i < 20; ++i) {
        rsi.update(100.0);
    }
    EXPECT_DOUBLE_EQ(rsi.value(), 100.0);
}

TEST_F(RSITest, Reset) {
    for (double price : prices) {
        rsi.update(price);
    }
    ASSERT_TRUE(rsi.is_ready());

    rsi.reset();
    EXPECT_FALSE(rsi.is_ready());
    EXPECT_DOUBLE_EQ(rsi.value(), 50.0);
}
