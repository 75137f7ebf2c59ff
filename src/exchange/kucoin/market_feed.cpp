// ============================================================================
// PULSE TRADE BOT - KuCoin Market Feed Implementation
// ============================================================================

#include "pulse/exchange/kucoin/market_feed.hpp"
#include "pulse/core/errors.hpp"
#include "pulse/market/frame_decoder.hpp"

#include <algorithm>
#include <stdexcept>

namespace pulse::exchange::kucoin {

// ============================================================================
// Protocol frames
// ============================================================================

std::array<std::string, 3> subscription_topics(const Symbol& symbol) {
    const std::string sym = symbol.str();
    return {
        std::string(market::TOPIC_EXECUTION) + sym,
        std::string(market::TOPIC_TICKER) + sym,
        std::string(market::TOPIC_INSTRUMENT) + sym,
    };
}

std::string make_subscribe_frame(std::string_view topic, std::string_view id) {
    std::string frame;
    frame.reserve(96 + topic.size());
    frame += "{\"id\":\"";
    frame += id;
    frame += "\",\"type\":\"subscribe\",\"topic\":\"";
    frame += topic;
    frame += "\",\"privateChannel\":false,\"response\":true}";
    return frame;
}

std::string make_ping_frame(std::string_view id) {
    return "{\"id\":\"" + std::string(id) + "\",\"type\":\"ping\"}";
}

network::WebSocketEndpoint make_feed_endpoint(const BulletToken& bullet,
                                              std::string_view connect_id,
                                              std::chrono::milliseconds max_ping_interval) {
    if (bullet.servers.empty()) {
        throw TransportError("bullet token has no instance servers");
    }
    const InstanceServer& server = bullet.servers.front();

    network::WebSocketEndpoint endpoint = network::parse_wss_url(server.endpoint);
    endpoint.target += endpoint.target.find('?') == std::string::npos ? '?' : '&';
    endpoint.target += "token=" + network::url_encode(bullet.token);
    endpoint.target += "&connectId=" + std::string(connect_id);

    // Ping at our interval unless the server wants it sooner
    endpoint.heartbeat_interval = server.ping_interval.count() > 0
        ? std::min(max_ping_interval, server.ping_interval)
        : max_ping_interval;
    return endpoint;
}

// ============================================================================
// Feed Handle Implementation
// ============================================================================

struct FeedHandle::Impl {
    Impl(const network::WebSocketConfig& config, MarketFeed::TokenProvider token_provider,
         const MarketFeed::ClientFactory& client_factory, const Symbol& symbol,
         MarketFeed::EventCallback on_event, std::shared_ptr<spdlog::logger> logger)
        : symbol_(symbol)
        , on_event_(std::move(on_event))
        , logger_(std::move(logger)) {

        const auto max_ping_interval = config.heartbeat_interval;
        network::IWebSocketClient::EndpointProvider endpoint_provider =
            [this, token_provider = std::move(token_provider), max_ping_interval]() {
                const BulletToken bullet = token_provider();
                return make_feed_endpoint(bullet, next_id(), max_ping_interval);
            };

        if (client_factory) {
            client_ = client_factory(config, std::move(endpoint_provider));
        } else {
            client_ = std::make_unique<network::WebSocketClient>(config, std::move(endpoint_provider), logger_);
        }
        if (!client_) {
            throw std::invalid_argument("MarketFeed client factory returned null");
        }

        client_->set_heartbeat([this] { return make_ping_frame(next_id()); });
        client_->on_message([this](std::string_view frame) { handle_frame(frame); });
        client_->on_connect([this] {
            logger_->info("Market feed connected, waiting for welcome ({})", symbol_.view());
        });
        client_->on_disconnect([this] {
            logger_->warn("Market feed disconnected ({})", symbol_.view());
        });
    }

    /// Runs on the I/O thread
    void handle_frame(std::string_view frame) {
        market::DecodeResult result = decoder_.decode(frame);

        switch (result.status) {
            case market::DecodeStatus::Event:
                delivered_.fetch_add(1, std::memory_order_relaxed);
                if (on_event_) {
                    on_event_(result.event);
                }
                break;

            case market::DecodeStatus::Control:
                handle_control(result);
                break;

            case market::DecodeStatus::Malformed:
                dropped_.fetch_add(1, std::memory_order_relaxed);
                logger_->debug("Dropped malformed frame: {}", result.error);
                break;

            case market::DecodeStatus::Ignored:
                break;
        }
    }

    void handle_control(const market::DecodeResult& result) {
        switch (result.control) {
            case market::ControlKind::Welcome:
                logger_->info("Welcome received (connectId={}), subscribing", result.id);
                for (const auto& topic : subscription_topics(symbol_)) {
                    client_->send(make_subscribe_frame(topic, next_id()));
                }
                break;
            case market::ControlKind::Ack:
                logger_->debug("Subscription acknowledged (id={})", result.id);
                break;
            case market::ControlKind::Pong:
                logger_->trace("Pong (id={})", result.id);
                break;
            case market::ControlKind::Error:
                logger_->warn("Feed error frame: {}", result.error);
                break;
            case market::ControlKind::None:
                break;
        }
    }

    std::string next_id() {
        return std::to_string(to_epoch_ms(now())) + std::to_string(id_counter_++ % 1000);
    }

    Symbol symbol_;
    MarketFeed::EventCallback on_event_;
    std::shared_ptr<spdlog::logger> logger_;

    market::FrameDecoder decoder_;
    std::unique_ptr<network::IWebSocketClient> client_;

    std::atomic<uint64_t> id_counter_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
};

FeedHandle::FeedHandle(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

FeedHandle::~FeedHandle() {
    stop();
}

void FeedHandle::stop() {
    impl_->client_->stop();
}

bool FeedHandle::is_connected() const {
    return impl_->client_->is_connected();
}

size_t FeedHandle::reconnect_count() const {
    return impl_->client_->reconnect_count();
}

uint64_t FeedHandle::events_delivered() const noexcept {
    return impl_->delivered_.load(std::memory_order_relaxed);
}

uint64_t FeedHandle::frames_dropped() const noexcept {
    return impl_->dropped_.load(std::memory_order_relaxed);
}

// ============================================================================
// Market Feed
// ============================================================================

MarketFeed::MarketFeed(const network::WebSocketConfig& config, TokenProvider token_provider,
                       std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , token_provider_(std::move(token_provider))
    , logger_(std::move(logger)) {}

MarketFeed::MarketFeed(const network::WebSocketConfig& config, KucoinClient& client,
                       std::shared_ptr<spdlog::logger> logger)
    : MarketFeed(config, [&client] { return client.request_public_token(); }, std::move(logger)) {}

std::unique_ptr<FeedHandle> MarketFeed::connect(const Symbol& symbol, EventCallback on_event) {
    auto impl = std::make_unique<FeedHandle::Impl>(config_, token_provider_, client_factory_, symbol,
                                                   std::move(on_event), logger_);
    if (on_reconnect_) {
        impl->client_->on_reconnect(on_reconnect_);
    }

    impl->client_->start();
    logger_->info("Market feed started for {}", symbol.view());
    return std::unique_ptr<FeedHandle>(new FeedHandle(std::move(impl)));
}

}  // namespace pulse::exchange::kucoin
