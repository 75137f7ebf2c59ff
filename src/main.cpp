// ============================================================================
// PULSE TRADE BOT - RSI/MACD Live Trading (Event-Driven Architecture)
// ============================================================================
// KuCoin Futures momentum bot on 1-second candles.
//
// Architecture:
//   [WS Thread] --push--> [SPSC Ring Buffer] --drain--> [EventLoop]
//                                                          |
//                                                  TradingPipeline
//                                          Candles -> RSI/MACD -> Signal
//                                                          |
//                                                 [Executor Thread] -> REST
// ============================================================================

#include "pulse/app/console_display.hpp"
#include "pulse/config/app_config.hpp"
#include "pulse/core/errors.hpp"
#include "pulse/core/event_loop.hpp"
#include "pulse/core/message_bus.hpp"
#include "pulse/exchange/kucoin/client.hpp"
#include "pulse/exchange/kucoin/market_feed.hpp"
#include "pulse/order/trade_executor.hpp"
#include "pulse/pipeline/trading_pipeline.hpp"
#include "pulse/utils/logger.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace pulse;

namespace {

// ============================================================================
// Config -> component settings
// ============================================================================

exchange::kucoin::KucoinConfig kucoin_config(const config::AppConfig& config) {
    exchange::kucoin::KucoinConfig kc;
    kc.credentials = config.exchange.credentials;
    kc.sandbox = config.exchange.sandbox;
    kc.request_timeout = std::chrono::seconds(config.feed.request_timeout_seconds);
    return kc;
}

network::WebSocketConfig websocket_config(const config::AppConfig& config) {
    network::WebSocketConfig ws;
    ws.connect_timeout = std::chrono::seconds(config.feed.request_timeout_seconds);
    ws.heartbeat_interval = std::chrono::seconds(config.feed.ping_interval_seconds);
    ws.reconnect_initial = std::chrono::seconds(config.feed.reconnect_initial_seconds);
    ws.reconnect_max = std::chrono::seconds(config.feed.reconnect_max_seconds);
    ws.stable_connection_threshold = std::chrono::seconds(config.feed.stable_connection_seconds);
    ws.idle_timeout = std::chrono::duration_cast<std::chrono::seconds>(ws.heartbeat_interval * 3);
    return ws;
}

pipeline::PipelineConfig pipeline_config(const config::AppConfig& config) {
    const Symbol symbol{config.trading.symbol};

    pipeline::PipelineConfig pc;
    pc.symbol = symbol;
    pc.aggregator.max_history = config.strategy.max_history;
    pc.signal.symbol = symbol;
    pc.signal.rsi_lower = config.strategy.rsi_lower;
    pc.signal.rsi_upper = config.strategy.rsi_upper;
    pc.signal.signal_buffer_seconds = config.strategy.signal_buffer_seconds;
    pc.signal.min_history = config.strategy.max_history;
    pc.signal.require_confluence = config.strategy.require_confluence;
    pc.display_candles = config.display.candles;
    return pc;
}

order::ExecutorConfig executor_config(const config::AppConfig& config) {
    order::ExecutorConfig ec;
    ec.symbol = Symbol{config.trading.symbol};
    ec.leverage = config.trading.leverage;
    ec.position_size = config.trading.position_size;
    return ec;
}

}  // namespace

// ============================================================================
// Trading Bot
// ============================================================================

class TradingBot {
public:
    TradingBot(const config::AppConfig& config, std::shared_ptr<spdlog::logger> logger)
        : config_(config)
        , logger_(std::move(logger))
        , client_(kucoin_config(config), logger_)
        , event_loop_(core::EventLoopConfig{}, logger_)
        , message_bus_(event_loop_.ring_buffer())
        , pipeline_(pipeline_config(config), logger_)
        , display_(config.display, std::cout)
        , feed_(websocket_config(config), client_, logger_) {

        if (config_.trading.enabled) {
            executor_ = std::make_unique<order::TradeExecutor>(executor_config(config_), client_, logger_);
        }
    }

    void start() {
        print_banner();

        if (config_.display.enabled) {
            pipeline_.add_observer(&display_);
            feed_.set_reconnect_callback([this](size_t attempt, std::chrono::seconds delay) {
                display_.on_reconnect(attempt, delay);
            });
        }
        event_loop_.set_handler(&pipeline_);

        if (executor_) {
            // Reports come back on the executor thread; observers live on the loop thread
            executor_->set_report_callback([this](const order::ExecutionReport& report) {
                event_loop_.post([this, report] { pipeline_.notify_execution(report); });
            });
            executor_->start();
            pipeline_.set_executor(executor_.get());
        } else {
            logger_->warn("Trading disabled: watch-only mode, signals will not be executed");
        }

        feed_handle_ = feed_.connect(Symbol{config_.trading.symbol}, [this](const MarketEvent& event) {
            message_bus_.publish(event);
        });

        logger_->info("Pipeline ready: WS Thread -> SPSC Ring Buffer -> EventLoop -> Strategy");
        logger_->info("Press Ctrl+C to stop");
    }

    /// Blocks until SIGINT / SIGTERM
    void run() {
        event_loop_.run();
    }

    void stop() {
        logger_->info("Stopping (signal {})...", event_loop_.stop_signal());
        event_loop_.stop();

        // Flatten before the socket goes away
        if (executor_) {
            executor_->stop();
            executor_->close_on_shutdown();
        }

        if (feed_handle_) {
            feed_handle_->stop();
        }

        print_stats();
    }

private:
    void print_banner() const {
        logger_->info("========================================");
        logger_->info("  PULSE TRADE BOT - RSI/MACD Strategy");
        logger_->info("  Symbol:   {}", config_.trading.symbol);
        logger_->info("  Exchange: KuCoin Futures ({})", config_.exchange.sandbox ? "sandbox" : "live");
        logger_->info("  Trading:  {} (x{}, size {})", config_.trading.enabled ? "ENABLED" : "WATCH ONLY",
                      config_.trading.leverage, config_.trading.position_size);
        logger_->info("  RSI:      {} / {}  Buffer: {}s  History: {}",
                      config_.strategy.rsi_lower, config_.strategy.rsi_upper,
                      config_.strategy.signal_buffer_seconds, config_.strategy.max_history);
        logger_->info("========================================");
    }

    void print_stats() const {
        const auto stats = pipeline_.stats();
        logger_->info("=== Pipeline Statistics ===");
        logger_->info("Events Processed:  {}", event_loop_.events_processed());
        logger_->info("Events Published:  {}", message_bus_.events_published());
        logger_->info("Events Dropped:    {} ({:.4f}%)", message_bus_.events_dropped(),
                      message_bus_.drop_rate() * 100.0);
        logger_->info("Handler Errors:    {}", event_loop_.handler_errors());
        logger_->info("Candles Closed:    {}", stats.candles_closed);
        logger_->info("Signals:           {} ({} submitted)", stats.signals, stats.signals_submitted);
        if (feed_handle_) {
            logger_->info("Frames Dropped:    {}", feed_handle_->frames_dropped());
            logger_->info("Reconnects:        {}", feed_handle_->reconnect_count());
        }
        if (executor_) {
            logger_->info("Orders Executed:   {} ({} failed)", executor_->executed(), executor_->failed());
        }
    }

    config::AppConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    exchange::kucoin::KucoinClient client_;
    core::EventLoop event_loop_;
    core::MessageBus message_bus_;
    pipeline::TradingPipeline pipeline_;
    app::ConsoleDisplay display_;
    std::unique_ptr<order::TradeExecutor> executor_;

    exchange::kucoin::MarketFeed feed_;
    std::unique_ptr<exchange::kucoin::FeedHandle> feed_handle_;
};

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.yaml";
    if (argc > 1 && argv[1][0] != '-') {
        config_path = argv[1];
    }

    config::AppConfig config;
    try {
        config = config::load_config(config_path);
        config::apply_env_overrides(config);
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "\n[ERROR] " << e.what() << "\n";
        return 1;
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = utils::make_logger(config.logging);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "\n[ERROR] Logger setup failed: " << e.what() << "\n";
        return 1;
    }
    logger->info("Loaded config from: {}", config_path);

    int exit_code = 0;
    try {
        TradingBot bot(config, logger);
        bot.start();
        bot.run();
        bot.stop();
    } catch (const std::exception& e) {
        logger->critical("Unhandled exception: {}", e.what());
        exit_code = 1;
    }

    logger->flush();
    spdlog::shutdown();
    return exit_code;
}
