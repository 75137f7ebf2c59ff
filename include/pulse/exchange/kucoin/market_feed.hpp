#pragma once
// ============================================================================
// PULSE TRADE BOT - KuCoin Market Feed
// ============================================================================
// Feed connection manager: bullet token -> websocket -> subscribe after
// welcome -> decode every frame -> on_event. Reconnects forever with backoff,
// fetching a fresh token for every attempt.
// ============================================================================

#include "pulse/core/market_event.hpp"
#include "pulse/core/types.hpp"
#include "pulse/exchange/kucoin/client.hpp"
#include "pulse/network/websocket_client.hpp"

#include <spdlog/logger.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace pulse::exchange::kucoin {

// ============================================================================
// Protocol frames
// ============================================================================

/// execution, tickerV2 and instrument topics for `symbol`
[[nodiscard]] std::array<std::string, 3> subscription_topics(const Symbol& symbol);

[[nodiscard]] std::string make_subscribe_frame(std::string_view topic, std::string_view id);
[[nodiscard]] std::string make_ping_frame(std::string_view id);

/// `endpoint?token=..&connectId=..` split into host/port/target
[[nodiscard]] network::WebSocketEndpoint make_feed_endpoint(const BulletToken& bullet,
                                                           std::string_view connect_id,
                                                           std::chrono::milliseconds max_ping_interval);

// ============================================================================
// Feed Handle
// ============================================================================

class FeedHandle {
public:
    ~FeedHandle();

    FeedHandle(const FeedHandle&) = delete;
    FeedHandle& operator=(const FeedHandle&) = delete;

    /// Idempotent, any thread. Heartbeat, reconnect timer, socket, then joins.
    void stop();

    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] size_t reconnect_count() const;
    [[nodiscard]] uint64_t events_delivered() const noexcept;
    [[nodiscard]] uint64_t frames_dropped() const noexcept;

private:
    friend class MarketFeed;

    struct Impl;
    explicit FeedHandle(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Market Feed
// ============================================================================

class MarketFeed {
public:
    using EventCallback = std::function<void(const MarketEvent&)>;
    using ReconnectCallback = network::IWebSocketClient::ReconnectCallback;

    /// Throws TransportError / AuthError
    using TokenProvider = std::function<BulletToken()>;

    /// Builds the websocket for one handle; defaults to network::WebSocketClient
    using ClientFactory = std::function<std::unique_ptr<network::IWebSocketClient>(
        const network::WebSocketConfig&, network::IWebSocketClient::EndpointProvider)>;

    MarketFeed(const network::WebSocketConfig& config, TokenProvider token_provider,
               std::shared_ptr<spdlog::logger> logger);

    /// Token fetched through `client`, which must outlive every handle
    MarketFeed(const network::WebSocketConfig& config, KucoinClient& client,
               std::shared_ptr<spdlog::logger> logger);

    /// Called on the I/O thread before each reconnect delay
    void set_reconnect_callback(ReconnectCallback callback) { on_reconnect_ = std::move(callback); }

    void set_client_factory(ClientFactory factory) { client_factory_ = std::move(factory); }

    /// `on_event` runs on the feed's I/O thread and must not block
    [[nodiscard]] std::unique_ptr<FeedHandle> connect(const Symbol& symbol, EventCallback on_event);

private:
    network::WebSocketConfig config_;
    TokenProvider token_provider_;
    std::shared_ptr<spdlog::logger> logger_;
    ReconnectCallback on_reconnect_;
    ClientFactory client_factory_;
};

}  // namespace pulse::exchange::kucoin
