#pragma once
// ============================================================================
// PULSE TRADE BOT - Trading Pipeline
// ============================================================================
// The single owner of CandleHistory and SignalState:
//
//   MarketEvent -> CandleAggregator -> (closed candle) -> SignalGenerator
//                                                            |
//                                        TradeExecutor::submit (non-blocking)
//
// Runs as the event loop's handler. A mutex serialises ingest against
// snapshot() so other threads only ever see whole candles.
// ============================================================================

#include "pulse/core/event_loop.hpp"
#include "pulse/market/candle_aggregator.hpp"
#include "pulse/order/trade_executor.hpp"
#include "pulse/pipeline/observer.hpp"
#include "pulse/strategy/signal_generator.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace pulse::pipeline {

struct PipelineConfig {
    Symbol symbol{"SOLUSDTM"};
    market::AggregatorConfig aggregator;
    strategy::SignalGeneratorConfig signal;
    size_t display_candles = 5;
};

struct PipelineStats {
    uint64_t events = 0;
    uint64_t candles_closed = 0;
    uint64_t signals = 0;
    uint64_t signals_submitted = 0;
};

class TradingPipeline : public core::IEventHandler {
public:
    TradingPipeline(const PipelineConfig& config, std::shared_ptr<spdlog::logger> logger);

    TradingPipeline(const TradingPipeline&) = delete;
    TradingPipeline& operator=(const TradingPipeline&) = delete;

    /// nullptr = watch only. Executor must outlive the pipeline.
    void set_executor(order::TradeExecutor* executor) noexcept { executor_ = executor; }

    /// Observer must outlive the pipeline
    void add_observer(IPipelineObserver* observer);

    // IEventHandler
    void on_market_event(const MarketEvent& event) override;
    void on_timer_event(core::TimerId id) override;

    /// Ingest one event; returns the signal it produced, if any
    std::optional<TradingSignal> process(const MarketEvent& event);

    /// Forward an execution result to observers (call on the loop thread)
    void notify_execution(const order::ExecutionReport& report);

    [[nodiscard]] PipelineSnapshot snapshot() const;
    [[nodiscard]] market::CandleSeries history() const;
    [[nodiscard]] std::optional<market::Candle> current() const;
    [[nodiscard]] PipelineStats stats() const;

private:
    PipelineConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    market::CandleAggregator aggregator_;
    strategy::SignalGenerator generator_;
    PipelineStats stats_;

    order::TradeExecutor* executor_ = nullptr;
    std::vector<IPipelineObserver*> observers_;
};

}  // namespace pulse::pipeline
