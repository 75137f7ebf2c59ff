#pragma once
// ============================================================================
// PULSE TRADE BOT - MACD (Moving Average Convergence Divergence)
// ============================================================================
// Trend-following momentum indicator
// Standard settings: 12/26/9 EMAs. The signal EMA runs over the MACD line
// from the first sample. All outputs read 0 until Slow + Signal samples.
// ============================================================================

#include "ema.hpp"
#include "indicator_base.hpp"

namespace pulse::strategy {

template <size_t FastPeriod = 12, size_t SlowPeriod = 26, size_t SignalPeriod = 9>
class MACD : public IndicatorBase<MACD<FastPeriod, SlowPeriod, SignalPeriod>> {
public:
    static_assert(FastPeriod < SlowPeriod, "Fast period must be less than slow period");

    static constexpr size_t WARMUP = SlowPeriod + SignalPeriod;

    MACD() { reset_impl(); }

    void update_impl(double price) {
        fast_ema_.update(price);
        slow_ema_.update(price);
        macd_line_ = fast_ema_.value() - slow_ema_.value();
        signal_ema_.update(macd_line_);
        ++count_;

        prev_histogram_ = histogram_;
        histogram_ = is_ready_impl() ? macd_line_ - signal_ema_.value() : 0.0;
    }

    /// MACD line (fast EMA - slow EMA)
    [[nodiscard]] double value_impl() const { return is_ready_impl() ? macd_line_ : 0.0; }

    /// Signal line (EMA of MACD)
    [[nodiscard]] double signal_line() const {
        return is_ready_impl() ? signal_ema_.value() : 0.0;
    }

    /// Histogram (MACD - Signal)
    [[nodiscard]] double histogram() const { return histogram_; }

    /// Histogram as of the previous update (0 if it was not ready then)
    [[nodiscard]] double previous_histogram() const { return prev_histogram_; }

    [[nodiscard]] bool is_ready_impl() const {
        return count_ >= WARMUP;
    }

    void reset_impl() {
        count_ = 0;
        macd_line_ = 0.0;
        histogram_ = 0.0;
        prev_histogram_ = 0.0;
        fast_ema_.reset();
        slow_ema_.reset();
        signal_ema_.reset();
    }

    [[nodiscard]] constexpr size_t period_impl() const { return WARMUP; }

    // ========================================================================
    // Crossovers
    // ========================================================================

    /// MACD crossed above the signal line on the last update
    [[nodiscard]] bool is_bullish_crossover() const {
        return is_ready_impl() && prev_histogram_ <= 0.0 && histogram_ > 0.0;
    }

    /// MACD crossed below the signal line on the last update
    [[nodiscard]] bool is_bearish_crossover() const {
        return is_ready_impl() && prev_histogram_ >= 0.0 && histogram_ < 0.0;
    }

private:
    EMA<FastPeriod> fast_ema_;
    EMA<SlowPeriod> slow_ema_;
    EMA<SignalPeriod> signal_ema_;

    size_t count_;
    double macd_line_;
    double histogram_;
    double prev_histogram_;
};

using MACD_12_26_9 = MACD<12, 26, 9>;

}  // namespace pulse::strategy
