#pragma once
// ============================================================================
// PULSE TRADE BOT - Frame Decoder
// ============================================================================
// Parse boundary between raw KuCoin websocket frames and MarketEvent.
// Nothing downstream ever sees JSON: a frame is either a validated event,
// a control frame, a frame for a topic we don't consume, or malformed.
// ============================================================================

#include "pulse/core/market_event.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace pulse::market {

enum class DecodeStatus : uint8_t {
    Event,      // market data, `event` is set
    Control,    // welcome / ack / pong / error, `control` is set
    Malformed,  // unparseable or missing a required field, `error` is set
    Ignored     // valid frame for a topic or subject we don't consume
};

enum class ControlKind : uint8_t {
    None,
    Welcome,
    Ack,
    Pong,
    Error
};

[[nodiscard]] std::string_view to_string(DecodeStatus status) noexcept;

struct DecodeResult {
    DecodeStatus status = DecodeStatus::Ignored;
    MarketEvent event{};
    ControlKind control = ControlKind::None;
    std::string id;     // control frame id (welcome carries the connectId)
    std::string error;  // malformed reason, or server error text

    [[nodiscard]] bool has_event() const noexcept { return status == DecodeStatus::Event; }
};

struct DecoderStats {
    uint64_t events = 0;
    uint64_t control = 0;
    uint64_t malformed = 0;
    uint64_t ignored = 0;
};

/// Not thread-safe; one decoder per receive loop.
class FrameDecoder {
public:
    FrameDecoder();
    ~FrameDecoder();

    FrameDecoder(const FrameDecoder&) = delete;
    FrameDecoder& operator=(const FrameDecoder&) = delete;

    [[nodiscard]] DecodeResult decode(std::string_view frame);

    [[nodiscard]] const DecoderStats& stats() const noexcept { return stats_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    DecoderStats stats_;
};

// ============================================================================
// Topic helpers (shared with the feed's subscribe logic)
// ============================================================================

inline constexpr std::string_view TOPIC_EXECUTION = "/contractMarket/execution:";
inline constexpr std::string_view TOPIC_TICKER = "/contractMarket/tickerV2:";
inline constexpr std::string_view TOPIC_INSTRUMENT = "/contract/instrument:";

}  // namespace pulse::market
