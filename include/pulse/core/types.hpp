#pragma once
// ============================================================================
// PULSE TRADE BOT - Core Types
// ============================================================================
// Fundamental type definitions shared by the feed, pipeline and execution
// ============================================================================

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace pulse {

// ============================================================================
// Time Types
// ============================================================================

/// Nanosecond precision timestamp
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Duration in nanoseconds
using Duration = std::chrono::nanoseconds;

inline constexpr int64_t NANOS_PER_SECOND = 1'000'000'000LL;

/// Get current timestamp with nanosecond precision
[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

/// Convert timestamp to Unix epoch milliseconds (KuCoin REST format)
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/// Convert Unix epoch milliseconds to Timestamp
[[nodiscard]] inline Timestamp from_epoch_ms(int64_t epoch_ms) noexcept {
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

/// Convert Unix epoch nanoseconds (KuCoin websocket `ts`) to Timestamp
[[nodiscard]] inline Timestamp from_epoch_ns(uint64_t epoch_ns) noexcept {
    return Timestamp{std::chrono::nanoseconds{static_cast<int64_t>(epoch_ns)}};
}

/// Whole seconds since epoch, truncated (bucket key for 1s candles)
[[nodiscard]] constexpr int64_t truncate_to_second(uint64_t epoch_ns) noexcept {
    return static_cast<int64_t>(epoch_ns / static_cast<uint64_t>(NANOS_PER_SECOND));
}

[[nodiscard]] inline Timestamp from_epoch_seconds(int64_t epoch_s) noexcept {
    return Timestamp{std::chrono::seconds{epoch_s}};
}

// ============================================================================
// Trading Types
// ============================================================================

/// Order / taker side
enum class Side : uint8_t {
    Buy = 0,
    Sell = 1
};

[[nodiscard]] constexpr Side opposite(Side side) noexcept {
    return side == Side::Buy ? Side::Sell : Side::Buy;
}

[[nodiscard]] constexpr std::string_view to_string(Side side) noexcept {
    return side == Side::Buy ? "buy" : "sell";
}

/// Discrete trading decision
enum class SignalType : uint8_t {
    Hold = 0,
    Buy = 1,
    Sell = 2
};

[[nodiscard]] constexpr std::string_view to_string(SignalType type) noexcept {
    switch (type) {
        case SignalType::Buy:  return "BUY";
        case SignalType::Sell: return "SELL";
        default:               return "HOLD";
    }
}

/// Side of the order that realises a signal (Hold has none; callers check first)
[[nodiscard]] constexpr Side to_side(SignalType type) noexcept {
    return type == SignalType::Sell ? Side::Sell : Side::Buy;
}

// ============================================================================
// Symbol Type
// ============================================================================

/// Contract symbol (e.g., "SOLUSDTM")
/// Fixed inline storage so it can travel inside trivially copyable events
class Symbol {
public:
    static constexpr size_t MAX_LENGTH = 15;

    Symbol() noexcept : length_(0) { data_[0] = '\0'; }

    explicit Symbol(std::string_view symbol) noexcept {
        length_ = static_cast<uint8_t>(std::min(symbol.size(), MAX_LENGTH));
        std::copy_n(symbol.data(), length_, data_);
        data_[length_] = '\0';
    }

    [[nodiscard]] std::string_view view() const noexcept {
        return {data_, length_};
    }

    [[nodiscard]] std::string str() const { return std::string(view()); }
    [[nodiscard]] const char* c_str() const noexcept { return data_; }
    [[nodiscard]] size_t size() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    bool operator==(const Symbol& other) const noexcept {
        return view() == other.view();
    }

    bool operator!=(const Symbol& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Symbol& other) const noexcept {
        return view() < other.view();
    }

private:
    char data_[MAX_LENGTH + 1];
    uint8_t length_;
};

// ============================================================================
// Signal Types
// ============================================================================

/// Emitted decision with the indicator values that produced it
struct TradingSignal {
    Symbol symbol;
    SignalType type = SignalType::Hold;
    double rsi = 50.0;
    double macd = 0.0;
    double signal_line = 0.0;
    double histogram = 0.0;
    double prev_histogram = 0.0;
    double reference_price = 0.0;  // close of the candle that triggered it
    Timestamp timestamp;           // candle time, not wall clock
};

}  // namespace pulse

// ============================================================================
// Hash specializations for use with containers
// ============================================================================
template <>
struct std::hash<pulse::Symbol> {
    size_t operator()(const pulse::Symbol& s) const noexcept {
        return std::hash<std::string_view>{}(s.view());
    }
};
