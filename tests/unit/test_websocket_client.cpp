// ============================================================================
// PULSE TRADE BOT - WebSocket Client Unit Tests
// ============================================================================

#include "pulse/core/errors.hpp"
#include "pulse/network/websocket_client.hpp"
#include "pulse/utils/logger.hpp"

#include <gtest/gtest.h>

#include <future>

using namespace pulse;
using namespace pulse::network;
using namespace std::chrono_literals;

// ============================================================================
// URL parsing
// ============================================================================

TEST(ParseWssUrlTest, HostAndPath) {
    const auto endpoint = parse_wss_url("wss://ws-api-futures.kucoin.com/endpoint");
    EXPECT_EQ(endpoint.host, "ws-api-futures.kucoin.com");
    EXPECT_EQ(endpoint.port, "443");
    EXPECT_EQ(endpoint.target, "/endpoint");
}

TEST(ParseWssUrlTest, ExplicitPortAndQuery) {
    const auto endpoint = parse_wss_url("wss://example.com:8443/ws?x=1");
    EXPECT_EQ(endpoint.host, "example.com");
    EXPECT_EQ(endpoint.port, "8443");
    EXPECT_EQ(endpoint.target, "/ws?x=1");
}

TEST(ParseWssUrlTest, BareHost) {
    const auto endpoint = parse_wss_url("wss://example.com");
    EXPECT_EQ(endpoint.host, "example.com");
    EXPECT_EQ(endpoint.target, "/");
}

TEST(ParseWssUrlTest, QueryWithoutPath) {
    EXPECT_EQ(parse_wss_url("wss://example.com?token=a").target, "/?token=a");
}

TEST(ParseWssUrlTest, RejectsOtherSchemes) {
    EXPECT_THROW((void)parse_wss_url("ws://example.com/"), TransportError);
    EXPECT_THROW((void)parse_wss_url("https://example.com/"), TransportError);
    EXPECT_THROW((void)parse_wss_url("wss:///path"), TransportError);
    EXPECT_THROW((void)parse_wss_url("wss://host:/path"), TransportError);
}

// ============================================================================
// Backoff
// ============================================================================

TEST(ReconnectBackoffTest, DoublesUpToCap) {
    ReconnectBackoff backoff(5s, 60s);
    EXPECT_EQ(backoff.next(), 5s);
    EXPECT_EQ(backoff.next(), 10s);
    EXPECT_EQ(backoff.next(), 20s);
    EXPECT_EQ(backoff.next(), 40s);
    EXPECT_EQ(backoff.next(), 60s);
    EXPECT_EQ(backoff.next(), 60s);
}

TEST(ReconnectBackoffTest, ResetReturnsToInitial) {
    ReconnectBackoff backoff(5s, 60s);
    (void)backoff.next();
    (void)backoff.next();
    EXPECT_EQ(backoff.peek(), 20s);

    backoff.reset();
    EXPECT_EQ(backoff.peek(), 5s);
    EXPECT_EQ(backoff.next(), 5s);
}

// ============================================================================
// Client lifecycle
// ============================================================================

class WebSocketClientTest : public ::testing::Test {
protected:
    WebSocketConfig config;
    std::shared_ptr<spdlog::logger> logger = utils::make_null_logger();
};

TEST_F(WebSocketClientTest, StopWithoutStartIsNoop) {
    WebSocketClient client(config, [] { return WebSocketEndpoint{}; }, logger);
    client.stop();
    client.stop();
    EXPECT_FALSE(client.is_connected());
    EXPECT_EQ(client.reconnect_count(), 0u);
}

TEST_F(WebSocketClientTest, FailedEndpointLookupSchedulesReconnect) {
    WebSocketClient client(
        config, []() -> WebSocketEndpoint { throw TransportError("token service down"); }, logger);

    std::promise<std::pair<size_t, std::chrono::seconds>> reconnect;
    std::promise<std::string> error;
    bool reconnect_set = false;
    bool error_set = false;

    client.on_error([&](const std::string& message) {
        if (!error_set) {
            error_set = true;
            error.set_value(message);
        }
    });
    client.on_reconnect([&](size_t attempt, std::chrono::seconds delay) {
        if (!reconnect_set) {
            reconnect_set = true;
            reconnect.set_value({attempt, delay});
        }
    });

    auto reconnect_future = reconnect.get_future();
    auto error_future = error.get_future();
    client.start();

    ASSERT_EQ(error_future.wait_for(5s), std::future_status::ready);
    EXPECT_NE(error_future.get().find("token service down"), std::string::npos);

    ASSERT_EQ(reconnect_future.wait_for(5s), std::future_status::ready);
    const auto [attempt, delay] = reconnect_future.get();
    EXPECT_EQ(attempt, 1u);
    EXPECT_EQ(delay, 5s);

    client.stop();
    EXPECT_FALSE(client.is_connected());
    EXPECT_EQ(client.reconnect_count(), 1u);
}

TEST_F(WebSocketClientTest, NoReconnectWhenDisabled) {
    config.auto_reconnect = false;
    WebSocketClient client(
        config, []() -> WebSocketEndpoint { throw TransportError("down"); }, logger);

    std::promise<void> failed;
    bool failed_set = false;
    client.on_error([&](const std::string&) {
        if (!failed_set) {
            failed_set = true;
            failed.set_value();
        }
    });

    auto future = failed.get_future();
    client.start();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);

    client.stop();
    EXPECT_EQ(client.reconnect_count(), 0u);
}

TEST_F(WebSocketClientTest, SendWhileDisconnectedIsDropped) {
    WebSocketClient client(
        config, []() -> WebSocketEndpoint { throw TransportError("down"); }, logger);
    client.start();
    client.send("{\"type\":\"ping\"}");
    client.stop();
    EXPECT_FALSE(client.is_connected());
}
