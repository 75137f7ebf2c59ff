// ============================================================================
// PULSE TRADE BOT - Frame Decoder Implementation
// ============================================================================
// simdjson On-Demand parsing. The envelope and the payload are each walked
// field by field, so key order in the frame does not matter.
// ============================================================================

#include "pulse/market/frame_decoder.hpp"
#include "pulse/core/errors.hpp"

#include <simdjson.h>

#include <optional>
#include <stdexcept>
#include <string>

namespace pulse::market {

namespace {

using simdjson::ondemand::json_type;

enum class TopicKind : uint8_t {
    Ticker,
    Execution,
    Instrument,
    Other
};

TopicKind classify_topic(std::string_view topic) noexcept {
    if (topic.starts_with(TOPIC_TICKER)) return TopicKind::Ticker;
    if (topic.starts_with(TOPIC_EXECUTION)) return TopicKind::Execution;
    if (topic.starts_with(TOPIC_INSTRUMENT)) return TopicKind::Instrument;
    return TopicKind::Other;
}

// KuCoin sends prices as strings on some channels and as numbers on others
double read_number(simdjson::ondemand::value& value) {
    const json_type type = value.type();
    switch (type) {
        case json_type::number:
            return double(value.get_double());
        case json_type::string: {
            std::string_view text = value.get_string();
            if (text.empty()) return 0.0;
            return std::stod(std::string(text));
        }
        case json_type::null:
            return 0.0;
        default:
            throw MalformedEventError("expected a number");
    }
}

uint64_t read_uint64(simdjson::ondemand::value& value) {
    const json_type type = value.type();
    if (type == json_type::number) {
        return uint64_t(value.get_uint64());
    }
    if (type == json_type::string) {
        std::string_view text = value.get_string();
        return std::stoull(std::string(text));
    }
    throw MalformedEventError("expected an integer timestamp");
}

Side read_side(simdjson::ondemand::value& value) {
    std::string_view text = value.get_string();
    if (text == "buy") return Side::Buy;
    if (text == "sell") return Side::Sell;
    throw MalformedEventError("unknown side: " + std::string(text));
}

TickerUpdate decode_ticker(simdjson::ondemand::object& data) {
    TickerUpdate ticker;
    std::optional<double> bid;
    std::optional<double> ask;
    std::optional<uint64_t> ts;

    for (simdjson::ondemand::field field : data) {
        std::string_view key = field.unescaped_key();
        if (key == "bestBidPrice") bid = read_number(field.value());
        else if (key == "bestAskPrice") ask = read_number(field.value());
        else if (key == "bestBidSize") ticker.bid_size = read_number(field.value());
        else if (key == "bestAskSize") ticker.ask_size = read_number(field.value());
        else if (key == "ts") ts = read_uint64(field.value());
    }

    if (!bid || !ask) throw MalformedEventError("tickerV2 without best bid/ask");
    if (!ts) throw MalformedEventError("tickerV2 without ts");

    ticker.bid_price = *bid;
    ticker.ask_price = *ask;
    ticker.event_time_ns = *ts;
    return ticker;
}

TradeExecution decode_execution(simdjson::ondemand::object& data) {
    TradeExecution trade;
    std::optional<double> price;
    std::optional<double> size;
    std::optional<Side> side;
    std::optional<uint64_t> ts;

    for (simdjson::ondemand::field field : data) {
        std::string_view key = field.unescaped_key();
        if (key == "price") price = read_number(field.value());
        else if (key == "size") size = read_number(field.value());
        else if (key == "side") side = read_side(field.value());
        else if (key == "ts") ts = read_uint64(field.value());
    }

    if (!price || !size || !side) throw MalformedEventError("match without price/size/side");
    if (!ts) throw MalformedEventError("match without ts");

    trade.price = *price;
    trade.size = *size;
    trade.side = *side;
    trade.event_time_ns = *ts;
    return trade;
}

InstrumentUpdate decode_instrument(simdjson::ondemand::object& data) {
    InstrumentUpdate update;
    std::optional<uint64_t> ts_ns;
    std::optional<uint64_t> timestamp_ms;

    for (simdjson::ondemand::field field : data) {
        std::string_view key = field.unescaped_key();
        if (key == "markPrice") {
            update.mark_price = read_number(field.value());
            update.has_mark = true;
        } else if (key == "indexPrice") {
            update.index_price = read_number(field.value());
            update.has_index = true;
        } else if (key == "fundingRate") {
            update.funding_rate = read_number(field.value());
            update.has_funding = true;
        } else if (key == "ts") {
            ts_ns = read_uint64(field.value());
        } else if (key == "timestamp") {
            timestamp_ms = read_uint64(field.value());
        }
    }

    if (ts_ns) {
        update.event_time_ns = *ts_ns;
    } else if (timestamp_ms) {
        update.event_time_ns = *timestamp_ms * 1'000'000ULL;
    } else {
        throw MalformedEventError("instrument update without ts/timestamp");
    }
    return update;
}

}  // namespace

std::string_view to_string(DecodeStatus status) noexcept {
    switch (status) {
        case DecodeStatus::Event:     return "event";
        case DecodeStatus::Control:   return "control";
        case DecodeStatus::Malformed: return "malformed";
        case DecodeStatus::Ignored:   return "ignored";
    }
    return "unknown";
}

// ============================================================================
// FrameDecoder
// ============================================================================

struct FrameDecoder::Impl {
    simdjson::ondemand::parser parser_;

    DecodeResult decode(std::string_view frame) {
        DecodeResult result;
        simdjson::padded_string padded(frame);
        simdjson::ondemand::document doc = parser_.iterate(padded);
        simdjson::ondemand::object root = doc.get_object();

        std::string_view type;
        std::string_view topic;
        std::string_view subject;
        bool has_data = false;

        // First pass: envelope only. `data` may appear before `topic`, so the
        // payload is decoded after classification.
        for (simdjson::ondemand::field field : root) {
            std::string_view key = field.unescaped_key();
            if (key == "type") {
                type = field.value().get_string();
            } else if (key == "topic") {
                topic = field.value().get_string();
            } else if (key == "subject") {
                subject = field.value().get_string();
            } else if (key == "id") {
                auto& value = field.value();
                if (value.type() == json_type::string) {
                    result.id = std::string(std::string_view(value.get_string()));
                } else {
                    result.id = std::string(std::string_view(value.raw_json_token()));
                }
            } else if (key == "data") {
                has_data = true;
            }
        }

        if (type.empty()) {
            throw MalformedEventError("frame without type");
        }

        if (type == "welcome" || type == "ack" || type == "pong" || type == "error") {
            result.status = DecodeStatus::Control;
            if (type == "welcome") result.control = ControlKind::Welcome;
            else if (type == "ack") result.control = ControlKind::Ack;
            else if (type == "pong") result.control = ControlKind::Pong;
            else {
                result.control = ControlKind::Error;
                result.error = std::string(frame);
            }
            return result;
        }

        if (type != "message") {
            result.status = DecodeStatus::Ignored;
            return result;
        }

        const TopicKind kind = classify_topic(topic);
        if (kind == TopicKind::Other) {
            result.status = DecodeStatus::Ignored;
            return result;
        }

        const bool wanted =
            (kind == TopicKind::Ticker && subject == "tickerV2") ||
            (kind == TopicKind::Execution && subject == "match") ||
            (kind == TopicKind::Instrument &&
             (subject == "mark.index.price" || subject == "funding.rate"));
        if (!wanted) {
            result.status = DecodeStatus::Ignored;
            return result;
        }

        if (!has_data) {
            throw MalformedEventError("market message without data");
        }

        // Second pass for the payload. Views into the first pass (type,
        // topic, subject) are not valid past this point.
        doc.rewind();
        simdjson::ondemand::object data = doc["data"].get_object();
        switch (kind) {
            case TopicKind::Ticker:     result.event = decode_ticker(data); break;
            case TopicKind::Execution:  result.event = decode_execution(data); break;
            case TopicKind::Instrument: result.event = decode_instrument(data); break;
            case TopicKind::Other:      break;
        }
        result.status = DecodeStatus::Event;
        return result;
    }
};

FrameDecoder::FrameDecoder() : impl_(std::make_unique<Impl>()) {}

FrameDecoder::~FrameDecoder() = default;

DecodeResult FrameDecoder::decode(std::string_view frame) {
    DecodeResult result;
    try {
        result = impl_->decode(frame);
    } catch (const simdjson::simdjson_error& e) {
        result = DecodeResult{};
        result.status = DecodeStatus::Malformed;
        result.error = e.what();
    } catch (const MalformedEventError& e) {
        result = DecodeResult{};
        result.status = DecodeStatus::Malformed;
        result.error = e.what();
    } catch (const std::logic_error& e) {
        // std::stod / std::stoull on a non-numeric string
        result = DecodeResult{};
        result.status = DecodeStatus::Malformed;
        result.error = std::string("bad number: ") + e.what();
    }

    switch (result.status) {
        case DecodeStatus::Event:     ++stats_.events; break;
        case DecodeStatus::Control:   ++stats_.control; break;
        case DecodeStatus::Malformed: ++stats_.malformed; break;
        case DecodeStatus::Ignored:   ++stats_.ignored; break;
    }
    return result;
}

}  // namespace pulse::market
