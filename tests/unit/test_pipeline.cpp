// ============================================================================
// PULSE TRADE BOT - Trading Pipeline Unit Tests
// ============================================================================

#include "pulse/core/errors.hpp"
#include "pulse/pipeline/trading_pipeline.hpp"
#include "pulse/utils/logger.hpp"

#include <gtest/gtest.h>

#include <condition_variable>
#include <mutex>
#include <vector>

using namespace pulse;
using namespace pulse::pipeline;
using namespace std::chrono_literals;

namespace {

constexpr uint64_t NS = 1'000'000'000ULL;

MarketEvent trade(uint64_t second, double price) {
    return TradeExecution{price, 1.0, Side::Buy, second * NS};
}

/// Steady decline: RSI pinned at 0 once the window is full
double declining_price(uint64_t second) {
    return 200.0 - 0.5 * static_cast<double>(second);
}

class RecordingObserver : public IPipelineObserver {
public:
    void on_candle_closed(const market::Candle& candle, size_t history_size) override {
        closed.push_back(candle);
        sizes.push_back(history_size);
    }
    void on_signal(const TradingSignal& signal) override { signals.push_back(signal); }
    void on_execution(const order::ExecutionReport& report) override { reports.push_back(report); }
    void on_refresh(const PipelineSnapshot& snapshot) override { refreshes.push_back(snapshot); }

    std::vector<market::Candle> closed;
    std::vector<size_t> sizes;
    std::vector<TradingSignal> signals;
    std::vector<order::ExecutionReport> reports;
    std::vector<PipelineSnapshot> refreshes;
};

/// Always flat, accepts every order
class FlatExchangeClient : public exchange::IExchangeClient {
public:
    std::optional<exchange::Position> get_position(const Symbol&) override { return std::nullopt; }
    void set_leverage(const Symbol&, int) override {}
    exchange::OrderResult close_position(const Symbol& symbol, const std::string&) override {
        throw OrderExecutionError("no open position on " + symbol.str(), {}, true);
    }
    exchange::OrderResult place_order(const exchange::OrderRequest& request) override {
        exchange::OrderResult result;
        result.order_id = "order-1";
        result.side = request.side;
        result.size = request.size;
        return result;
    }
};

}  // namespace

class TradingPipelineTest : public ::testing::Test {
protected:
    TradingPipelineTest() : pipeline(make_config(), utils::make_null_logger()) {
        pipeline.add_observer(&observer);
    }

    static PipelineConfig make_config() {
        PipelineConfig config;
        config.aggregator.max_history = 100;
        config.signal.min_history = 100;
        config.display_candles = 5;
        return config;
    }

    /// One trade per second on the declining ramp for [from, to)
    std::vector<TradingSignal> feed_declining(uint64_t from, uint64_t to) {
        std::vector<TradingSignal> out;
        for (uint64_t s = from; s < to; ++s) {
            if (auto signal = pipeline.process(trade(s, declining_price(s)))) {
                out.push_back(*signal);
            }
        }
        return out;
    }

    RecordingObserver observer;
    TradingPipeline pipeline;
};

TEST_F(TradingPipelineTest, ClosesCandleOnNextSecond) {
    EXPECT_FALSE(pipeline.process(trade(0, 100.0)).has_value());
    EXPECT_FALSE(pipeline.process(trade(0, 101.0)).has_value());
    EXPECT_FALSE(pipeline.process(trade(1, 99.0)).has_value());

    const auto history = pipeline.history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].bucket_start, 0);
    EXPECT_DOUBLE_EQ(history[0].open, 100.0);
    EXPECT_DOUBLE_EQ(history[0].high, 101.0);
    EXPECT_DOUBLE_EQ(history[0].low, 100.0);
    EXPECT_DOUBLE_EQ(history[0].close, 101.0);

    const auto current = pipeline.current();
    ASSERT_TRUE(current.has_value());
    EXPECT_DOUBLE_EQ(current->close, 99.0);

    ASSERT_EQ(observer.closed.size(), 1u);
    EXPECT_EQ(observer.sizes[0], 1u);

    const auto stats = pipeline.stats();
    EXPECT_EQ(stats.events, 3u);
    EXPECT_EQ(stats.candles_closed, 1u);
}

TEST_F(TradingPipelineTest, NoEvaluationUntilHistoryIsFull) {
    // Seconds 0..99 close candles 0..98
    EXPECT_TRUE(feed_declining(0, 100).empty());

    const auto snap = pipeline.snapshot();
    EXPECT_EQ(snap.history_size, 99u);
    EXPECT_FALSE(snap.indicators.has_value());
    EXPECT_EQ(snap.signals.evaluations, 0u);
}

TEST_F(TradingPipelineTest, SignalOnceHistoryIsFull) {
    const auto signals = feed_declining(0, 101);

    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].type, SignalType::Buy);
    EXPECT_EQ(to_epoch_ms(signals[0].timestamp), 99'000);
    EXPECT_DOUBLE_EQ(signals[0].reference_price, declining_price(99));

    ASSERT_EQ(observer.signals.size(), 1u);
    EXPECT_EQ(pipeline.stats().signals, 1u);
    EXPECT_EQ(pipeline.stats().signals_submitted, 0u);  // watch only
}

TEST_F(TradingPipelineTest, CooldownAcrossCandles) {
    ASSERT_EQ(feed_declining(0, 101).size(), 1u);

    // Candles 100 and 101 fall inside the 3 s buffer after candle 99
    EXPECT_TRUE(feed_declining(101, 103).empty());

    const auto again = feed_declining(103, 104);
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(to_epoch_ms(again[0].timestamp), 102'000);

    const auto snap = pipeline.snapshot();
    EXPECT_EQ(snap.history_size, 100u);
    EXPECT_EQ(snap.signals.suppressed, 2u);
    EXPECT_EQ(snap.aggregator.evicted, 3u);
}

TEST_F(TradingPipelineTest, LateEventsDoNotChangeHistory) {
    feed_declining(0, 10);
    const auto before = pipeline.history();

    EXPECT_FALSE(pipeline.process(trade(3, 1000.0)).has_value());
    EXPECT_EQ(pipeline.history(), before);
    EXPECT_EQ(pipeline.snapshot().aggregator.late, 1u);
}

TEST_F(TradingPipelineTest, SnapshotCarriesDisplayState) {
    feed_declining(0, 101);
    pipeline.process(InstrumentUpdate{.mark_price = 150.5,
                                      .index_price = 150.4,
                                      .funding_rate = 0.0001,
                                      .event_time_ns = 100 * NS,
                                      .has_mark = true,
                                      .has_index = true,
                                      .has_funding = true});

    const auto snap = pipeline.snapshot();
    EXPECT_EQ(snap.symbol, Symbol("SOLUSDTM"));
    ASSERT_EQ(snap.recent.size(), 5u);
    EXPECT_EQ(snap.recent.back().bucket_start, 99);
    EXPECT_EQ(snap.min_history, 100u);
    EXPECT_DOUBLE_EQ(snap.market.mark_price, 150.5);
    EXPECT_DOUBLE_EQ(snap.market.funding_rate, 0.0001);
    ASSERT_TRUE(snap.indicators.has_value());
    EXPECT_TRUE(snap.indicators->emitted);
    ASSERT_TRUE(snap.signal_state.last_signal.has_value());
    EXPECT_EQ(*snap.signal_state.last_signal, SignalType::Buy);
}

TEST_F(TradingPipelineTest, DisplayTimerRefreshesObservers) {
    pipeline.process(trade(0, 100.0));
    pipeline.on_timer_event(core::TimerId::Display);

    ASSERT_EQ(observer.refreshes.size(), 1u);
    EXPECT_TRUE(observer.refreshes[0].current.has_value());
}

TEST_F(TradingPipelineTest, MarketEventHandlerFeedsPipeline) {
    core::IEventHandler& handler = pipeline;
    handler.on_market_event(trade(0, 100.0));
    handler.on_market_event(trade(1, 100.0));
    EXPECT_EQ(pipeline.history().size(), 1u);
}

TEST_F(TradingPipelineTest, SignalsAreSubmittedToExecutor) {
    FlatExchangeClient client;
    order::TradeExecutor executor(order::ExecutorConfig{}, client, utils::make_null_logger());

    std::mutex mutex;
    std::condition_variable cv;
    std::optional<order::ExecutionReport> report;
    executor.set_report_callback([&](const order::ExecutionReport& r) {
        std::lock_guard<std::mutex> lock(mutex);
        report = r;
        cv.notify_one();
    });
    executor.start();
    pipeline.set_executor(&executor);

    ASSERT_EQ(feed_declining(0, 101).size(), 1u);
    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, 5s, [&] { return report.has_value(); }));
    }
    executor.stop();

    EXPECT_EQ(pipeline.stats().signals_submitted, 1u);
    EXPECT_EQ(report->action, order::ExecutionAction::Opened);
    EXPECT_EQ(report->signal.type, SignalType::Buy);

    pipeline.notify_execution(*report);
    ASSERT_EQ(observer.reports.size(), 1u);
    EXPECT_EQ(observer.reports[0].order->order_id, "order-1");
}
