#pragma once
// ============================================================================
// PULSE TRADE BOT - Candle
// ============================================================================
// One-second OHLCV bucket. Invariant: low <= open, close <= high.
// ============================================================================

#include "pulse/core/types.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace pulse::market {

struct Candle {
    int64_t bucket_start = 0;  // whole seconds since epoch, inclusive
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    uint32_t trade_count = 0;

    /// New bucket seeded from a single observation
    [[nodiscard]] static Candle open_at(int64_t second, double price, double size) noexcept {
        Candle c;
        c.bucket_start = second;
        c.open = c.high = c.low = c.close = price;
        c.volume = size;
        c.trade_count = 1;
        return c;
    }

    /// Fold another observation from the same bucket
    void update(double price, double size) noexcept {
        high = std::max(high, price);
        low = std::min(low, price);
        close = price;
        volume += size;
        ++trade_count;
    }

    [[nodiscard]] Timestamp start_time() const noexcept {
        return from_epoch_seconds(bucket_start);
    }

    bool operator==(const Candle&) const = default;
};

using CandleSeries = std::vector<Candle>;

/// Side-channel data for display; never feeds aggregation
struct MarketState {
    double mark_price = 0.0;
    double index_price = 0.0;
    double funding_rate = 0.0;
    double last_price = 0.0;
    double best_bid = 0.0;
    double best_ask = 0.0;
    uint64_t last_update_ns = 0;
};

}  // namespace pulse::market
