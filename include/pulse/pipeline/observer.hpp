#pragma once
// ============================================================================
// PULSE TRADE BOT - Pipeline Observer
// ============================================================================
// Structured event sink for display and telemetry. All callbacks run on the
// event loop thread; implementations must not block.
// ============================================================================

#include "pulse/core/types.hpp"
#include "pulse/market/candle.hpp"
#include "pulse/market/candle_aggregator.hpp"
#include "pulse/order/trade_executor.hpp"
#include "pulse/strategy/signal_generator.hpp"

#include <cstdint>
#include <optional>

namespace pulse::pipeline {

/// Read-only copy of the pipeline state
struct PipelineSnapshot {
    Symbol symbol;
    market::CandleSeries recent;  // last N closed candles, oldest first
    std::optional<market::Candle> current;
    size_t history_size = 0;
    size_t min_history = 0;
    market::MarketState market;
    std::optional<strategy::IndicatorSnapshot> indicators;
    strategy::SignalState signal_state;
    market::AggregatorStats aggregator;
    strategy::SignalStats signals;
};

class IPipelineObserver {
public:
    virtual ~IPipelineObserver() = default;

    virtual void on_candle_closed(const market::Candle& /*candle*/, size_t /*history_size*/) {}
    virtual void on_signal(const TradingSignal& /*signal*/) {}
    virtual void on_execution(const order::ExecutionReport& /*report*/) {}

    /// Periodic refresh (display timer)
    virtual void on_refresh(const PipelineSnapshot& /*snapshot*/) {}
};

}  // namespace pulse::pipeline
