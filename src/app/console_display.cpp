// ============================================================================
// PULSE TRADE BOT - Console Display Implementation
// ============================================================================

#include "pulse/app/console_display.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

namespace pulse::app {

namespace {

constexpr const char* ANSI_GREEN = "\033[32m";
constexpr const char* ANSI_RED = "\033[31m";
constexpr const char* ANSI_RESET = "\033[0m";

/// HH:MM:SS (UTC) of a bucket second
std::string format_second(int64_t epoch_s) {
    const std::time_t t = static_cast<std::time_t>(epoch_s);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

}  // namespace

ConsoleDisplay::ConsoleDisplay(const DisplayConfig& config, std::ostream& out)
    : config_(config), out_(out) {}

const char* ConsoleDisplay::colour(SignalType type) const noexcept {
    if (!config_.color) return "";
    switch (type) {
        case SignalType::Buy:  return ANSI_GREEN;
        case SignalType::Sell: return ANSI_RED;
        default:               return "";
    }
}

const char* ConsoleDisplay::reset() const noexcept {
    return config_.color ? ANSI_RESET : "";
}

void ConsoleDisplay::write(const std::string& text) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << text;
    out_.flush();
}

void ConsoleDisplay::on_signal(const TradingSignal& signal) {
    if (!config_.enabled) return;
    std::ostringstream line;
    line << colour(signal.type) << "[SIGNAL] " << to_string(signal.type) << reset()
         << " " << signal.symbol.view()
         << std::fixed << std::setprecision(4)
         << " @ " << signal.reference_price
         << std::setprecision(2) << " | RSI " << signal.rsi
         << std::setprecision(6) << " | MACD " << signal.macd
         << " sig " << signal.signal_line
         << " hist " << signal.histogram << " (prev " << signal.prev_histogram << ")\n";
    write(line.str());
}

void ConsoleDisplay::on_execution(const order::ExecutionReport& report) {
    if (!config_.enabled) return;
    std::ostringstream line;
    line << "[ORDER] " << to_string(report.signal.type) << " -> " << to_string(report.action)
         << " (position before " << report.position_before << ")";
    if (report.order) {
        line << " orderId=" << report.order->order_id;
    }
    if (!report.error.empty()) {
        line << " error: " << report.error;
    }
    line << "\n";
    write(line.str());
}

void ConsoleDisplay::on_refresh(const pipeline::PipelineSnapshot& snap) {
    if (!config_.enabled) return;
    std::ostringstream screen;

    screen << "\n=== " << snap.symbol.view() << " | candles " << snap.history_size << "/"
           << snap.min_history << " ===\n";

    screen << std::fixed << std::setprecision(4)
           << "Mark: " << snap.market.mark_price
           << "  Index: " << snap.market.index_price
           << std::setprecision(6) << "  Funding: " << snap.market.funding_rate * 100.0 << "%\n";

    const size_t shown = std::min(config_.candles, snap.recent.size());
    const auto first = snap.recent.end() - static_cast<std::ptrdiff_t>(shown);
    screen << std::setprecision(4);
    for (auto it = first; it != snap.recent.end(); ++it) {
        const bool up = it->close >= it->open;
        screen << (config_.color ? (up ? ANSI_GREEN : ANSI_RED) : "")
               << format_second(it->bucket_start)
               << "  O " << std::setw(10) << it->open
               << "  H " << std::setw(10) << it->high
               << "  L " << std::setw(10) << it->low
               << "  C " << std::setw(10) << it->close
               << "  V " << std::setw(10) << it->volume
               << "  n " << it->trade_count
               << reset() << "\n";
    }
    if (snap.current) {
        screen << format_second(snap.current->bucket_start) << "  (open) C " << snap.current->close
               << "  n " << snap.current->trade_count << "\n";
    }

    if (snap.indicators) {
        const auto& ind = *snap.indicators;
        screen << std::setprecision(2) << "RSI: " << ind.rsi
               << std::setprecision(6) << "  MACD: " << ind.macd.macd
               << "  Signal: " << ind.macd.signal
               << "  Hist: " << ind.macd.histogram << "\n";
    } else {
        screen << "Indicators: warming up\n";
    }

    if (snap.signal_state.last_signal) {
        screen << "Last signal: " << colour(*snap.signal_state.last_signal)
               << to_string(*snap.signal_state.last_signal) << reset()
               << " at " << format_second(snap.signal_state.last_signal_time.value_or(0)) << "\n";
    }

    std::lock_guard<std::mutex> lock(out_mutex_);
    ++refreshes_;
    out_ << screen.str();
    out_.flush();
}

void ConsoleDisplay::on_reconnect(size_t attempt, std::chrono::seconds delay) {
    if (!config_.enabled) return;
    write("[WS] Reconnect attempt " + std::to_string(attempt) + " in " +
          std::to_string(delay.count()) + "s\n");
}

}  // namespace pulse::app
