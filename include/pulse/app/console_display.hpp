#pragma once
// ============================================================================
// PULSE TRADE BOT - Console Display
// ============================================================================
// Pipeline observer that renders the last few candles, mark/index/funding
// and indicator values on each refresh, plus one line per signal/execution.
// ============================================================================

#include "pulse/pipeline/observer.hpp"

#include <chrono>
#include <iosfwd>
#include <mutex>
#include <string>

namespace pulse::app {

struct DisplayConfig {
    bool enabled = true;
    size_t candles = 5;
    bool color = true;  // ANSI colours for BUY/SELL and candle direction
};

class ConsoleDisplay : public pipeline::IPipelineObserver {
public:
    /// `out` must outlive the display
    ConsoleDisplay(const DisplayConfig& config, std::ostream& out);

    void on_signal(const TradingSignal& signal) override;
    void on_execution(const order::ExecutionReport& report) override;
    void on_refresh(const pipeline::PipelineSnapshot& snapshot) override;

    /// Feed reconnect notice (called from the feed's I/O thread)
    void on_reconnect(size_t attempt, std::chrono::seconds delay);

    [[nodiscard]] size_t refreshes() const noexcept { return refreshes_; }

private:
    [[nodiscard]] const char* colour(SignalType type) const noexcept;
    [[nodiscard]] const char* reset() const noexcept;

    /// Each line is formatted on its own stream; `out_` only ever receives text
    void write(const std::string& text);

    DisplayConfig config_;
    std::ostream& out_;
    std::mutex out_mutex_;
    size_t refreshes_ = 0;
};

}  // namespace pulse::app
