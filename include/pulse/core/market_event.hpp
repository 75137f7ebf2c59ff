#pragma once
// ============================================================================
// PULSE TRADE BOT - Market Events
// ============================================================================
// Tagged variant produced by the frame decoder and consumed exactly once by
// the candle aggregator. Trivially copyable so it fits the SPSC ring buffer.
// ============================================================================

#include "pulse/core/types.hpp"

#include <cstdint>
#include <type_traits>
#include <variant>

namespace pulse {

/// Best bid/ask snapshot (tickerV2)
struct TickerUpdate {
    double bid_price = 0.0;
    double bid_size = 0.0;
    double ask_price = 0.0;
    double ask_size = 0.0;
    uint64_t event_time_ns = 0;
};

/// Public trade (execution / match)
struct TradeExecution {
    double price = 0.0;
    double size = 0.0;
    Side side = Side::Buy;
    uint64_t event_time_ns = 0;
};

/// Mark / index price and funding rate (instrument channel).
/// Each subject carries a subset of the fields; the flags say which.
struct InstrumentUpdate {
    double mark_price = 0.0;
    double index_price = 0.0;
    double funding_rate = 0.0;
    uint64_t event_time_ns = 0;
    bool has_mark = false;
    bool has_index = false;
    bool has_funding = false;
};

using MarketEvent = std::variant<TickerUpdate, TradeExecution, InstrumentUpdate>;

static_assert(std::is_trivially_copyable_v<MarketEvent>,
              "MarketEvent must be trivially copyable for the ring buffer");

[[nodiscard]] inline uint64_t event_time_ns(const MarketEvent& event) noexcept {
    return std::visit([](const auto& e) { return e.event_time_ns; }, event);
}

[[nodiscard]] inline int64_t event_second(const MarketEvent& event) noexcept {
    return truncate_to_second(event_time_ns(event));
}

}  // namespace pulse
