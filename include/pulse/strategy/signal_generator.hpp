#pragma once
// ============================================================================
// PULSE TRADE BOT - RSI + MACD Signal Generator
// ============================================================================
// Evaluated once per closed candle over the rolling close history.
//
//   BUY  candidate: RSI < rsi_lower  or  histogram crosses above zero
//   SELL candidate: RSI > rsi_upper  or  histogram crosses below zero
//
// SELL is checked after BUY and wins a tie. A candidate inside the cooldown
// window (measured on candle time) is suppressed whatever its direction.
// ============================================================================

#include "pulse/core/types.hpp"
#include "pulse/strategy/indicators/series.hpp"

#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>

namespace pulse::strategy {

struct SignalGeneratorConfig {
    Symbol symbol{"SOLUSDTM"};
    double rsi_lower = 40.0;
    double rsi_upper = 60.0;
    int64_t signal_buffer_seconds = 3;
    size_t min_history = 100;

    // RSI and MACD must independently agree within signal_buffer_seconds
    bool require_confluence = false;
};

/// Indicator values from the most recent evaluation (for display)
struct IndicatorSnapshot {
    double rsi = RSI<RSI_PERIOD>::NEUTRAL;
    MacdValues macd;
    double prev_histogram = 0.0;
    double close = 0.0;
    int64_t candle_time = 0;
    size_t history_size = 0;
    SignalType candidate = SignalType::Hold;
    bool emitted = false;
};

struct SignalState {
    std::optional<SignalType> last_signal;
    std::optional<int64_t> last_signal_time;  // candle second
};

struct SignalStats {
    uint64_t evaluations = 0;
    uint64_t insufficient_history = 0;
    uint64_t candidates = 0;
    uint64_t suppressed = 0;
    uint64_t emitted = 0;
};

class SignalGenerator {
public:
    SignalGenerator(const SignalGeneratorConfig& config, std::shared_ptr<spdlog::logger> logger);

    /// Evaluate the closed history. `candle_time` is the bucket second of the
    /// candle that just closed. Returns the signal when one is emitted.
    std::optional<TradingSignal> evaluate(std::span<const double> closes, int64_t candle_time);

    [[nodiscard]] const std::optional<IndicatorSnapshot>& last_evaluation() const noexcept {
        return last_evaluation_;
    }

    [[nodiscard]] const SignalState& state() const noexcept { return state_; }
    [[nodiscard]] const SignalStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const SignalGeneratorConfig& config() const noexcept { return config_; }

    void reset();

private:
    struct ComponentSignal {
        SignalType type = SignalType::Hold;
        int64_t time = 0;
    };

    [[nodiscard]] SignalType either_candidate(const IndicatorSnapshot& snap) const noexcept;
    [[nodiscard]] SignalType confluence_candidate(const IndicatorSnapshot& snap) noexcept;
    [[nodiscard]] bool in_cooldown(int64_t candle_time) const noexcept;

    SignalGeneratorConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    SignalState state_;
    SignalStats stats_;
    std::optional<IndicatorSnapshot> last_evaluation_;

    // Confluence mode only
    ComponentSignal last_rsi_signal_;
    ComponentSignal last_macd_signal_;
};

}  // namespace pulse::strategy
