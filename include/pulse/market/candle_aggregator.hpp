#pragma once
// ============================================================================
// PULSE TRADE BOT - Candle Aggregator
// ============================================================================
// Folds market events into 1-second candles. Events for a newer second close
// the current candle into a bounded history; events for an older second are
// dropped so closed candles are never amended.
// Not thread-safe: owned by the pipeline and called from one thread.
// ============================================================================

#include "pulse/core/market_event.hpp"
#include "pulse/market/candle.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace pulse::market {

struct AggregatorConfig {
    size_t max_history = 100;
};

struct AggregatorStats {
    uint64_t ingested = 0;   // events that updated a candle
    uint64_t ignored = 0;    // no usable price
    uint64_t late = 0;       // older than the current bucket
    uint64_t closed = 0;     // candles moved into history
    uint64_t evicted = 0;    // candles dropped from the front of history
};

class CandleAggregator {
public:
    explicit CandleAggregator(const AggregatorConfig& config = {});

    /// Fold one event. Returns the candle it closed, if any.
    std::optional<Candle> ingest(const MarketEvent& event);

    /// Closed candles, oldest first
    [[nodiscard]] CandleSeries history() const;

    /// Close prices of the closed candles, oldest first
    [[nodiscard]] std::vector<double> closes() const;

    /// Last `n` closed candles (fewer if history is shorter)
    [[nodiscard]] CandleSeries recent(size_t n) const;

    /// Copy of the open candle
    [[nodiscard]] std::optional<Candle> current() const { return current_; }

    [[nodiscard]] const MarketState& market_state() const noexcept { return market_state_; }
    [[nodiscard]] const AggregatorStats& stats() const noexcept { return stats_; }

    [[nodiscard]] size_t size() const noexcept { return history_.size(); }
    [[nodiscard]] size_t max_history() const noexcept { return config_.max_history; }

    void reset();

private:
    struct Observation {
        double price;
        double size;
    };

    /// Price/size to fold for this event, after side-channel updates
    std::optional<Observation> observe(const MarketEvent& event);

    AggregatorConfig config_;
    std::deque<Candle> history_;
    std::optional<Candle> current_;
    MarketState market_state_;
    AggregatorStats stats_;
};

}  // namespace pulse::market
