#pragma once
// ============================================================================
// PULSE TRADE BOT - Trade Executor
// ============================================================================
// Turns signals into orders with a flip-or-open policy:
//   BUY  : flat -> open long, short -> close then open long, long -> skip
//   SELL : mirrored
// Orders run on a dedicated worker thread so the pipeline never waits on
// REST I/O. Results are delivered as ExecutionReports.
// ============================================================================

#include "pulse/core/types.hpp"
#include "pulse/exchange/exchange_client.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace pulse::order {

enum class ExecutionAction : uint8_t {
    Skipped,  // already positioned in the signal's direction, or HOLD
    Opened,   // was flat, opened a position
    Flipped,  // closed the opposite position, then opened
    Failed    // exchange or transport error, see `error`
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionAction action) noexcept {
    switch (action) {
        case ExecutionAction::Skipped: return "SKIPPED";
        case ExecutionAction::Opened:  return "OPENED";
        case ExecutionAction::Flipped: return "FLIPPED";
        case ExecutionAction::Failed:  return "FAILED";
    }
    return "UNKNOWN";
}

struct ExecutionReport {
    TradingSignal signal;
    ExecutionAction action = ExecutionAction::Skipped;
    double position_before = 0.0;
    std::optional<exchange::OrderResult> close_order;
    std::optional<exchange::OrderResult> order;
    std::string error;
};

struct ExecutorConfig {
    Symbol symbol{"SOLUSDTM"};
    int leverage = 5;
    double position_size = 1.0;
};

class TradeExecutor {
public:
    using ReportCallback = std::function<void(const ExecutionReport&)>;

    /// `client` must outlive the executor
    TradeExecutor(const ExecutorConfig& config, exchange::IExchangeClient& client,
                  std::shared_ptr<spdlog::logger> logger);
    ~TradeExecutor();

    TradeExecutor(const TradeExecutor&) = delete;
    TradeExecutor& operator=(const TradeExecutor&) = delete;

    /// Start the worker thread
    void start();

    /// Finish queued jobs, then join the worker. Idempotent.
    void stop();

    /// Queue `signal` on the worker; returns immediately. Dropped when not started.
    bool submit(const TradingSignal& signal);

    /// Apply the policy synchronously on the calling thread
    ExecutionReport execute(const TradingSignal& signal);

    /// Best-effort flatten, on the calling thread. "No position" counts as
    /// success; anything else is logged and returns false.
    bool close_on_shutdown();

    /// Invoked on the worker thread; set before start()
    void set_report_callback(ReportCallback callback) { on_report_ = std::move(callback); }

    /// pulse_<epoch_ms>_<counter>
    [[nodiscard]] std::string next_client_order_id();

    [[nodiscard]] const ExecutorConfig& config() const noexcept { return config_; }
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t submitted() const noexcept { return submitted_.load(); }
    [[nodiscard]] uint64_t executed() const noexcept { return executed_.load(); }
    [[nodiscard]] uint64_t failed() const noexcept { return failed_.load(); }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    ExecutorConfig config_;
    exchange::IExchangeClient& client_;
    std::shared_ptr<spdlog::logger> logger_;
    ReportCallback on_report_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> order_counter_{0};
    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> executed_{0};
    std::atomic<uint64_t> failed_{0};
};

}  // namespace pulse::order
