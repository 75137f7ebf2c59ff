// ============================================================================
// PULSE TRADE BOT - Signal Generator Implementation
// ============================================================================

#include "pulse/strategy/signal_generator.hpp"

#include <cstdlib>

namespace pulse::strategy {

SignalGenerator::SignalGenerator(const SignalGeneratorConfig& config,
                                 std::shared_ptr<spdlog::logger> logger)
    : config_(config), logger_(std::move(logger)) {}

std::optional<TradingSignal> SignalGenerator::evaluate(std::span<const double> closes,
                                                       int64_t candle_time) {
    if (closes.size() < config_.min_history || closes.empty()) {
        ++stats_.insufficient_history;
        return std::nullopt;
    }
    ++stats_.evaluations;

    IndicatorSnapshot snap;
    snap.rsi = compute_rsi(closes);
    snap.macd = compute_macd(closes);
    snap.prev_histogram = compute_macd(closes.first(closes.size() - 1)).histogram;
    snap.close = closes.back();
    snap.candle_time = candle_time;
    snap.history_size = closes.size();
    snap.candidate = config_.require_confluence ? confluence_candidate(snap)
                                                : either_candidate(snap);

    if (snap.candidate == SignalType::Hold) {
        last_evaluation_ = snap;
        return std::nullopt;
    }
    ++stats_.candidates;

    if (in_cooldown(candle_time)) {
        ++stats_.suppressed;
        logger_->debug("{} candidate suppressed: {}s since last signal (buffer {}s)",
                       to_string(snap.candidate), candle_time - *state_.last_signal_time,
                       config_.signal_buffer_seconds);
        last_evaluation_ = snap;
        return std::nullopt;
    }

    state_.last_signal = snap.candidate;
    state_.last_signal_time = candle_time;
    ++stats_.emitted;
    snap.emitted = true;
    last_evaluation_ = snap;

    TradingSignal signal;
    signal.symbol = config_.symbol;
    signal.type = snap.candidate;
    signal.rsi = snap.rsi;
    signal.macd = snap.macd.macd;
    signal.signal_line = snap.macd.signal;
    signal.histogram = snap.macd.histogram;
    signal.prev_histogram = snap.prev_histogram;
    signal.reference_price = snap.close;
    signal.timestamp = from_epoch_seconds(candle_time);
    return signal;
}

SignalType SignalGenerator::either_candidate(const IndicatorSnapshot& snap) const noexcept {
    const double hist = snap.macd.histogram;
    const double prev = snap.prev_histogram;

    SignalType candidate = SignalType::Hold;
    if (snap.rsi < config_.rsi_lower || (hist > 0.0 && prev <= 0.0)) {
        candidate = SignalType::Buy;
    }
    if (snap.rsi > config_.rsi_upper || (hist < 0.0 && prev >= 0.0)) {
        candidate = SignalType::Sell;
    }
    return candidate;
}

SignalType SignalGenerator::confluence_candidate(const IndicatorSnapshot& snap) noexcept {
    const double hist = snap.macd.histogram;
    const double prev = snap.prev_histogram;

    if (snap.rsi < config_.rsi_lower) {
        last_rsi_signal_ = {SignalType::Buy, snap.candle_time};
    } else if (snap.rsi > config_.rsi_upper) {
        last_rsi_signal_ = {SignalType::Sell, snap.candle_time};
    }

    if (hist > 0.0 && prev <= 0.0) {
        last_macd_signal_ = {SignalType::Buy, snap.candle_time};
    } else if (hist < 0.0 && prev >= 0.0) {
        last_macd_signal_ = {SignalType::Sell, snap.candle_time};
    }

    if (last_rsi_signal_.type == SignalType::Hold ||
        last_rsi_signal_.type != last_macd_signal_.type) {
        return SignalType::Hold;
    }
    const int64_t gap = std::llabs(last_rsi_signal_.time - last_macd_signal_.time);
    return gap <= config_.signal_buffer_seconds ? last_rsi_signal_.type : SignalType::Hold;
}

bool SignalGenerator::in_cooldown(int64_t candle_time) const noexcept {
    if (!state_.last_signal_time) return false;
    return candle_time - *state_.last_signal_time < config_.signal_buffer_seconds;
}

void SignalGenerator::reset() {
    state_ = SignalState{};
    stats_ = SignalStats{};
    last_evaluation_.reset();
    last_rsi_signal_ = ComponentSignal{};
    last_macd_signal_ = ComponentSignal{};
}

}  // namespace pulse::strategy
