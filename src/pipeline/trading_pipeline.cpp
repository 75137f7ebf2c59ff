// ============================================================================
// PULSE TRADE BOT - Trading Pipeline Implementation
// ============================================================================

#include "pulse/pipeline/trading_pipeline.hpp"
#include "pulse/utils/logger.hpp"

namespace pulse::pipeline {

TradingPipeline::TradingPipeline(const PipelineConfig& config, std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , logger_(std::move(logger))
    , aggregator_(config.aggregator)
    , generator_(config.signal, logger_) {}

void TradingPipeline::add_observer(IPipelineObserver* observer) {
    if (observer != nullptr) {
        observers_.push_back(observer);
    }
}

void TradingPipeline::on_market_event(const MarketEvent& event) {
    process(event);
}

void TradingPipeline::on_timer_event(core::TimerId id) {
    if (id != core::TimerId::Display || observers_.empty()) return;

    const PipelineSnapshot snap = snapshot();
    for (auto* observer : observers_) {
        observer->on_refresh(snap);
    }
}

std::optional<TradingSignal> TradingPipeline::process(const MarketEvent& event) {
    std::optional<market::Candle> closed;
    std::optional<TradingSignal> signal;
    size_t history_size = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.events;

        closed = aggregator_.ingest(event);
        if (!closed) {
            return std::nullopt;
        }

        ++stats_.candles_closed;
        history_size = aggregator_.size();
        logger_->debug("Candle closed {} O={} H={} L={} C={} V={} n={} (history {})",
                       closed->bucket_start, closed->open, closed->high, closed->low,
                       closed->close, closed->volume, closed->trade_count, history_size);

        // Not ready until the window is full
        if (history_size >= config_.signal.min_history) {
            utils::ScopedTimer timer(*logger_, "signal evaluation", utils::LogLevel::Trace);
            const std::vector<double> closes = aggregator_.closes();
            signal = generator_.evaluate(closes, closed->bucket_start);
            if (signal) {
                ++stats_.signals;
            }
        }
    }

    // Observers may call snapshot(); notify without holding the lock
    for (auto* observer : observers_) {
        observer->on_candle_closed(*closed, history_size);
    }

    if (!signal) {
        return std::nullopt;
    }

    logger_->info("{} signal @ {:.4f} (RSI {:.2f}, MACD hist {:.6f} prev {:.6f})",
                  to_string(signal->type), signal->reference_price, signal->rsi,
                  signal->histogram, signal->prev_histogram);

    for (auto* observer : observers_) {
        observer->on_signal(*signal);
    }

    if (executor_ != nullptr && executor_->submit(*signal)) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.signals_submitted;
    }
    return signal;
}

void TradingPipeline::notify_execution(const order::ExecutionReport& report) {
    for (auto* observer : observers_) {
        observer->on_execution(report);
    }
}

PipelineSnapshot TradingPipeline::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PipelineSnapshot snap;
    snap.symbol = config_.symbol;
    snap.recent = aggregator_.recent(config_.display_candles);
    snap.current = aggregator_.current();
    snap.history_size = aggregator_.size();
    snap.min_history = config_.signal.min_history;
    snap.market = aggregator_.market_state();
    snap.indicators = generator_.last_evaluation();
    snap.signal_state = generator_.state();
    snap.aggregator = aggregator_.stats();
    snap.signals = generator_.stats();
    return snap;
}

market::CandleSeries TradingPipeline::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregator_.history();
}

std::optional<market::Candle> TradingPipeline::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregator_.current();
}

PipelineStats TradingPipeline::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace pulse::pipeline
