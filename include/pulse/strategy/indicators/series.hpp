#pragma once
// ============================================================================
// PULSE TRADE BOT - Indicator Series Functions
// ============================================================================
// Stateless wrappers recomputing an indicator from a full close series.
// Each one folds the streaming indicator over the span, so the incremental
// and from-scratch results cannot drift apart.
// ============================================================================

#include "macd.hpp"
#include "rsi.hpp"

#include <span>

namespace pulse::strategy {

inline constexpr size_t RSI_PERIOD = 14;
inline constexpr size_t MACD_FAST = 12;
inline constexpr size_t MACD_SLOW = 26;
inline constexpr size_t MACD_SIGNAL = 9;

struct MacdValues {
    double macd = 0.0;
    double signal = 0.0;
    double histogram = 0.0;
};

/// RSI(14) of `closes` (oldest first); 50 with fewer than 15 closes
[[nodiscard]] inline double compute_rsi(std::span<const double> closes) {
    RSI<RSI_PERIOD> rsi;
    rsi.update(closes);
    return rsi.value();
}

/// MACD(12, 26, 9) of `closes` (oldest first); all zero with fewer than 35 closes
[[nodiscard]] inline MacdValues compute_macd(std::span<const double> closes) {
    MACD<MACD_FAST, MACD_SLOW, MACD_SIGNAL> macd;
    macd.update(closes);
    return MacdValues{macd.value(), macd.signal_line(), macd.histogram()};
}

}  // namespace pulse::strategy
