// ============================================================================
// PULSE TRADE BOT - Trade Executor Implementation
// ============================================================================

#include "pulse/order/trade_executor.hpp"
#include "pulse/core/errors.hpp"
#include "pulse/utils/logger.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <optional>
#include <thread>

namespace pulse::order {

namespace net = boost::asio;

struct TradeExecutor::Impl {
    net::io_context io_context_{1};
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work_guard_;
    std::thread worker_;
};

TradeExecutor::TradeExecutor(const ExecutorConfig& config, exchange::IExchangeClient& client,
                             std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_unique<Impl>())
    , config_(config)
    , client_(client)
    , logger_(std::move(logger)) {}

TradeExecutor::~TradeExecutor() {
    stop();
}

void TradeExecutor::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;

    impl_->io_context_.restart();
    impl_->work_guard_.emplace(impl_->io_context_.get_executor());
    impl_->worker_ = std::thread([this] {
        impl_->io_context_.run();
    });
    logger_->info("Trade executor started ({} x{} size {})",
                  config_.symbol.view(), config_.leverage, config_.position_size);
}

void TradeExecutor::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) return;

    // Queued orders still run; run() returns once the queue is empty
    impl_->work_guard_.reset();
    if (impl_->worker_.joinable()) {
        impl_->worker_.join();
    }
    logger_->info("Trade executor stopped ({} executed, {} failed)", executed(), failed());
}

bool TradeExecutor::submit(const TradingSignal& signal) {
    if (!running_) {
        logger_->warn("Executor not running, dropping {} signal", to_string(signal.type));
        return false;
    }

    submitted_.fetch_add(1, std::memory_order_relaxed);
    net::post(impl_->io_context_, [this, signal] {
        ExecutionReport report = execute(signal);
        if (on_report_) {
            try {
                on_report_(report);
            } catch (const std::exception& e) {
                logger_->error("Execution report callback threw: {}", e.what());
            }
        }
    });
    return true;
}

ExecutionReport TradeExecutor::execute(const TradingSignal& signal) {
    ExecutionReport report;
    report.signal = signal;

    if (signal.type == SignalType::Hold) {
        return report;
    }

    const Side side = to_side(signal.type);
    utils::ScopedTimer timer(*logger_, "order execution");

    try {
        const auto position = client_.get_position(config_.symbol);
        report.position_before = position ? position->quantity : 0.0;

        client_.set_leverage(config_.symbol, config_.leverage);

        // Never pyramid: only act when flat or positioned against the signal
        const bool aligned = side == Side::Buy ? report.position_before > 0.0
                                               : report.position_before < 0.0;
        if (aligned) {
            logger_->info("{} signal skipped, already {} {}", to_string(signal.type),
                          side == Side::Buy ? "long" : "short", report.position_before);
            return report;
        }

        if (report.position_before != 0.0) {
            try {
                report.close_order = client_.close_position(config_.symbol, next_client_order_id());
            } catch (const OrderExecutionError& e) {
                if (!e.no_position()) throw;
                logger_->info("Position already closed before flip: {}", e.what());
            }
        }

        exchange::OrderRequest request;
        request.symbol = config_.symbol;
        request.side = side;
        request.size = config_.position_size;
        request.leverage = config_.leverage;
        request.client_order_id = next_client_order_id();

        report.order = client_.place_order(request);
        report.action = report.close_order ? ExecutionAction::Flipped : ExecutionAction::Opened;
        executed_.fetch_add(1, std::memory_order_relaxed);

        logger_->info("{} executed: {} (position before {}, order {})", to_string(signal.type),
                      to_string(report.action), report.position_before, report.order->order_id);
    } catch (const Error& e) {
        report.action = ExecutionAction::Failed;
        report.error = e.what();
        failed_.fetch_add(1, std::memory_order_relaxed);
        logger_->error("{} execution failed: {}", to_string(signal.type), e.what());
    }

    return report;
}

bool TradeExecutor::close_on_shutdown() {
    try {
        const auto result = client_.close_position(config_.symbol, next_client_order_id());
        logger_->info("Shutdown close submitted (order {})", result.order_id);
        return true;
    } catch (const OrderExecutionError& e) {
        if (e.no_position()) {
            logger_->info("No open position to close on shutdown");
            return true;
        }
        logger_->error("Shutdown close failed: {}", e.what());
    } catch (const Error& e) {
        logger_->error("Shutdown close failed: {}", e.what());
    }
    return false;
}

std::string TradeExecutor::next_client_order_id() {
    return "pulse_" + std::to_string(to_epoch_ms(now())) + "_" +
           std::to_string(order_counter_.fetch_add(1, std::memory_order_relaxed));
}

}  // namespace pulse::order
