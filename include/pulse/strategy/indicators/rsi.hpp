#pragma once
// ============================================================================
// PULSE TRADE BOT - RSI (Relative Strength Index)
// ============================================================================
// Momentum oscillator measuring speed and magnitude of price changes
// Range: 0-100. Exponential smoothing with alpha = 1 / Period, seeded with
// the first price difference. Reads 50 until Period + 1 prices are seen.
// ============================================================================

#include "indicator_base.hpp"

#include <algorithm>

namespace pulse::strategy {

template <size_t Period = 14>
class RSI : public IndicatorBase<RSI<Period>> {
public:
    static_assert(Period > 0, "Period must be positive");

    static constexpr double ALPHA = 1.0 / static_cast<double>(Period);
    static constexpr double NEUTRAL = 50.0;

    RSI() { reset_impl(); }

    void update_impl(double price) {
        if (count_ == 0) {
            prev_price_ = price;
            ++count_;
            return;
        }

        const double change = price - prev_price_;
        prev_price_ = price;

        const double gain = std::max(change, 0.0);
        const double loss = std::max(-change, 0.0);

        if (count_ == 1) {
            avg_gain_ = gain;
            avg_loss_ = loss;
        } else {
            avg_gain_ += ALPHA * (gain - avg_gain_);
            avg_loss_ += ALPHA * (loss - avg_loss_);
        }
        ++count_;
    }

    [[nodiscard]] double value_impl() const {
        if (!is_ready_impl()) return NEUTRAL;

        if (avg_loss_ == 0.0) return 100.0;  // All gains, max RSI

        const double rs = avg_gain_ / avg_loss_;
        return 100.0 - (100.0 / (1.0 + rs));
    }

    [[nodiscard]] bool is_ready_impl() const {
        return count_ > Period;
    }

    void reset_impl() {
        count_ = 0;
        prev_price_ = 0.0;
        avg_gain_ = 0.0;
        avg_loss_ = 0.0;
    }

    [[nodiscard]] constexpr size_t period_impl() const { return Period + 1; }

    [[nodiscard]] bool is_below(double threshold) const { return value_impl() < threshold; }
    [[nodiscard]] bool is_above(double threshold) const { return value_impl() > threshold; }

private:
    size_t count_;
    double prev_price_;
    double avg_gain_;
    double avg_loss_;
};

using RSI14 = RSI<14>;

}  // namespace pulse::strategy
