#pragma once
// ============================================================================
// PULSE TRADE BOT - KuCoin Futures Client
// ============================================================================
// REST adapter for the order side (position, leverage, market orders) plus
// the public websocket token bootstrap used by the market feed.
// ============================================================================

#include "pulse/exchange/exchange_client.hpp"
#include "pulse/exchange/kucoin/auth.hpp"
#include "pulse/network/rest_client.hpp"

#include <spdlog/logger.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace pulse::exchange::kucoin {

inline constexpr std::string_view SUCCESS_CODE = "200000";
inline constexpr std::string_view LIVE_HOST = "api-futures.kucoin.com";
inline constexpr std::string_view SANDBOX_HOST = "api-sandbox-futures.kucoin.com";

// ============================================================================
// Public Token (bullet-public)
// ============================================================================

struct InstanceServer {
    std::string endpoint;  // wss://...
    std::chrono::milliseconds ping_interval{18000};
    std::chrono::milliseconds ping_timeout{10000};
};

struct BulletToken {
    std::string token;
    std::vector<InstanceServer> servers;
};

// ============================================================================
// Client Configuration
// ============================================================================

struct KucoinConfig {
    Credentials credentials;
    bool sandbox = false;
    std::chrono::seconds request_timeout{10};

    [[nodiscard]] std::string rest_host() const {
        return std::string(sandbox ? SANDBOX_HOST : LIVE_HOST);
    }
};

// ============================================================================
// KuCoin Client
// ============================================================================

class KucoinClient : public IExchangeClient {
public:
    KucoinClient(const KucoinConfig& config, std::shared_ptr<spdlog::logger> logger);

    /// Inject the transport (tests, alternative HTTP stacks)
    KucoinClient(const KucoinConfig& config, std::unique_ptr<network::IRestClient> rest,
                 std::shared_ptr<spdlog::logger> logger);

    ~KucoinClient() override;

    KucoinClient(const KucoinClient&) = delete;
    KucoinClient& operator=(const KucoinClient&) = delete;

    // IExchangeClient
    [[nodiscard]] std::optional<Position> get_position(const Symbol& symbol) override;
    void set_leverage(const Symbol& symbol, int leverage) override;
    OrderResult close_position(const Symbol& symbol, const std::string& client_order_id) override;
    OrderResult place_order(const OrderRequest& request) override;

    /// POST /api/v1/bullet-public. Throws TransportError / AuthError.
    [[nodiscard]] BulletToken request_public_token();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace pulse::exchange::kucoin
