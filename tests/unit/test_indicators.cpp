// ============================================================================
// PULSE TRADE BOT - Indicator Series Unit Tests
// ============================================================================

#include "pulse/strategy/indicators/ema.hpp"
#include "pulse/strategy/indicators/series.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace pulse::strategy;

static_assert(Indicator<EMA9>);
static_assert(Indicator<RSI14>);
static_assert(Indicator<MACD_12_26_9>);

// ============================================================================
// EMA Tests
// ============================================================================

TEST(EMATest, SeededWithFirstSample) {
    EMA<3> ema;
    ema.update(1.0);
    EXPECT_DOUBLE_EQ(ema.value(), 1.0);
    EXPECT_FALSE(ema.is_ready());

    ema.update(2.0);
    EXPECT_DOUBLE_EQ(ema.value(), 1.5);

    ema.update(3.0);
    EXPECT_DOUBLE_EQ(ema.value(), 2.25);
    EXPECT_TRUE(ema.is_ready());
    EXPECT_EQ(ema.count(), 3u);
}

TEST(EMATest, ConstantSeriesStaysConstant) {
    EMA26 ema;
    for (int i = 0; i < 50; ++i) {
        ema.update(42.0);
    }
    EXPECT_DOUBLE_EQ(ema.value(), 42.0);
}

// ============================================================================
// Series Function Tests
// ============================================================================

class SeriesTest : public ::testing::Test {
protected:
    std::vector<double> ramp(int count, double start, double step) {
        std::vector<double> out;
        for (int i = 0; i < count; ++i) {
            out.push_back(start + step * i);
        }
        return out;
    }
};

TEST_F(SeriesTest, RsiNeutralWhenShort) {
    const auto closes = ramp(14, 100.0, 1.0);
    EXPECT_DOUBLE_EQ(compute_rsi(closes), 50.0);
    EXPECT_DOUBLE_EQ(compute_rsi({}), 50.0);
}

TEST_F(SeriesTest, MacdZeroWhenShort) {
    const auto closes = ramp(34, 100.0, 1.0);
    const auto values = compute_macd(closes);
    EXPECT_DOUBLE_EQ(values.macd, 0.0);
    EXPECT_DOUBLE_EQ(values.signal, 0.0);
    EXPECT_DOUBLE_EQ(values.histogram, 0.0);
}

TEST_F(SeriesTest, MacdKnownValues) {
    const auto values = compute_macd(ramp(40, 1.0, 1.0));
    EXPECT_NEAR(values.macd, 6.386727317589845, 1e-9);
    EXPECT_NEAR(values.signal, 6.114555740619218, 1e-9);
    EXPECT_NEAR(values.histogram, 0.272171576970627, 1e-9);
}

TEST_F(SeriesTest, MatchesStreamingIndicators) {
    std::vector<double> closes;
    for (int i = 0; i < 100; ++i) {
        closes.push_back(100.0 + ((i * 37) % 11) * 0.25 - 1.0);
    }

    RSI14 rsi;
    MACD_12_26_9 macd;
    for (double c : closes) {
        rsi.update(c);
        macd.update(c);
    }

    EXPECT_DOUBLE_EQ(compute_rsi(closes), rsi.value());
    const auto values = compute_macd(closes);
    EXPECT_DOUBLE_EQ(values.macd, macd.value());
    EXPECT_DOUBLE_EQ(values.histogram, macd.histogram());
}

TEST_F(SeriesTest, RsiBounded) {
    const auto up = ramp(100, 100.0, 0.5);
    const auto down = ramp(100, 200.0, -0.5);
    EXPECT_DOUBLE_EQ(compute_rsi(up), 100.0);
    EXPECT_DOUBLE_EQ(compute_rsi(down), 0.0);
}
