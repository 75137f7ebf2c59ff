#pragma once
// ============================================================================
// PULSE TRADE BOT - EMA (Exponential Moving Average)
// ============================================================================
// Seeded with the first sample, alpha = 2 / (Period + 1). Matches the
// recursive (non-adjusted) EMA, so a streaming instance and a from-scratch
// fold over the same series give identical values.
// ============================================================================

#include "indicator_base.hpp"

namespace pulse::strategy {

template <size_t Period>
class EMA : public IndicatorBase<EMA<Period>> {
public:
    static_assert(Period > 0, "Period must be positive");

    // Smoothing multiplier: 2 / (Period + 1)
    static constexpr double MULTIPLIER = 2.0 / (Period + 1);

    EMA() { reset_impl(); }

    void update_impl(double price) {
        if (count_ == 0) {
            ema_ = price;
        } else {
            ema_ = (price - ema_) * MULTIPLIER + ema_;
        }
        ++count_;
    }

    [[nodiscard]] double value_impl() const { return ema_; }

    [[nodiscard]] bool is_ready_impl() const { return count_ >= Period; }

    void reset_impl() {
        count_ = 0;
        ema_ = 0.0;
    }

    [[nodiscard]] constexpr size_t period_impl() const { return Period; }

    [[nodiscard]] size_t count() const { return count_; }

private:
    size_t count_;
    double ema_;
};

using EMA9 = EMA<9>;
using EMA12 = EMA<12>;
using EMA26 = EMA<26>;

}  // namespace pulse::strategy
