// ============================================================================
// PULSE TRADE BOT - Candle Aggregator Implementation
// ============================================================================

#include "pulse/market/candle_aggregator.hpp"

#include <cmath>
#include <type_traits>

namespace pulse::market {

namespace {

[[nodiscard]] bool usable_price(double price) noexcept {
    return std::isfinite(price) && price > 0.0;
}

[[nodiscard]] double finite_or_zero(double value) noexcept {
    return std::isfinite(value) ? value : 0.0;
}

}  // namespace

CandleAggregator::CandleAggregator(const AggregatorConfig& config)
    : config_(config) {
    if (config_.max_history == 0) {
        config_.max_history = 1;
    }
}

std::optional<CandleAggregator::Observation> CandleAggregator::observe(const MarketEvent& event) {
    return std::visit(
        [this](const auto& e) -> std::optional<Observation> {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, TickerUpdate>) {
                if (!usable_price(e.bid_price) || !usable_price(e.ask_price)) {
                    return std::nullopt;
                }
                market_state_.best_bid = e.bid_price;
                market_state_.best_ask = e.ask_price;
                return Observation{(e.bid_price + e.ask_price) / 2.0,
                                   (finite_or_zero(e.bid_size) + finite_or_zero(e.ask_size)) / 2.0};
            } else if constexpr (std::is_same_v<T, TradeExecution>) {
                if (!usable_price(e.price)) {
                    return std::nullopt;
                }
                return Observation{e.price, finite_or_zero(e.size)};
            } else {
                // Mark/index and funding arrive as separate subjects
                if (e.has_mark && usable_price(e.mark_price)) market_state_.mark_price = e.mark_price;
                if (e.has_index && usable_price(e.index_price)) market_state_.index_price = e.index_price;
                if (e.has_funding && std::isfinite(e.funding_rate)) {
                    market_state_.funding_rate = e.funding_rate;
                }
                market_state_.last_update_ns = e.event_time_ns;

                if (!e.has_mark || !usable_price(e.mark_price)) {
                    return std::nullopt;
                }
                return Observation{e.mark_price, 0.0};
            }
        },
        event);
}

std::optional<Candle> CandleAggregator::ingest(const MarketEvent& event) {
    const auto obs = observe(event);
    if (!obs) {
        ++stats_.ignored;
        return std::nullopt;
    }

    const int64_t second = event_second(event);
    std::optional<Candle> closed;

    if (!current_) {
        current_ = Candle::open_at(second, obs->price, obs->size);
    } else if (second == current_->bucket_start) {
        current_->update(obs->price, obs->size);
    } else if (second < current_->bucket_start) {
        ++stats_.late;
        return std::nullopt;
    } else {
        closed = *current_;
        history_.push_back(*closed);
        ++stats_.closed;
        while (history_.size() > config_.max_history) {
            history_.pop_front();
            ++stats_.evicted;
        }
        current_ = Candle::open_at(second, obs->price, obs->size);
    }

    ++stats_.ingested;
    market_state_.last_price = obs->price;
    market_state_.last_update_ns = event_time_ns(event);
    return closed;
}

CandleSeries CandleAggregator::history() const {
    return CandleSeries(history_.begin(), history_.end());
}

std::vector<double> CandleAggregator::closes() const {
    std::vector<double> result;
    result.reserve(history_.size());
    for (const auto& candle : history_) {
        result.push_back(candle.close);
    }
    return result;
}

CandleSeries CandleAggregator::recent(size_t n) const {
    const size_t count = std::min(n, history_.size());
    return CandleSeries(history_.end() - static_cast<std::ptrdiff_t>(count), history_.end());
}

void CandleAggregator::reset() {
    history_.clear();
    current_.reset();
    market_state_ = MarketState{};
    stats_ = AggregatorStats{};
}

}  // namespace pulse::market
