// ============================================================================
// PULSE TRADE BOT - KuCoin Market Feed Unit Tests
// ============================================================================

#include "pulse/core/errors.hpp"
#include "pulse/exchange/kucoin/market_feed.hpp"
#include "pulse/utils/logger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <string>
#include <vector>

using namespace pulse;
using namespace pulse::exchange::kucoin;
using namespace std::chrono_literals;

namespace {

class FakeWebSocketClient : public network::IWebSocketClient {
public:
    explicit FakeWebSocketClient(EndpointProvider provider) : endpoint_provider(std::move(provider)) {}

    void start() override { started = true; }
    void stop() override { ++stop_calls; }
    [[nodiscard]] bool is_connected() const override { return started; }
    [[nodiscard]] size_t reconnect_count() const override { return 0; }
    void send(std::string message) override { sent.push_back(std::move(message)); }

    void on_message(MessageCallback callback) override { message_cb = std::move(callback); }
    void on_error(ErrorCallback) override {}
    void on_connect(ConnectCallback callback) override { connect_cb = std::move(callback); }
    void on_disconnect(DisconnectCallback) override {}
    void on_reconnect(ReconnectCallback) override {}
    void set_heartbeat(HeartbeatProvider provider) override { heartbeat = std::move(provider); }

    void receive(std::string_view frame) { message_cb(frame); }

    EndpointProvider endpoint_provider;
    HeartbeatProvider heartbeat;
    MessageCallback message_cb;
    ConnectCallback connect_cb;
    std::vector<std::string> sent;
    bool started = false;
    int stop_calls = 0;
};

BulletToken sample_token(std::chrono::milliseconds ping = 18000ms) {
    BulletToken bullet;
    bullet.token = "2neAiuYvAU61ZDXANAGAsiL4-iAExhsBXZxftpOeh_55i3Ysy2q2LEsEWU64mdzUOPusi34M_wGoSf7iNyEWJ4aBZXpWhrmY9jKtqkdWoFa75w3istPvPtiYB9J6i9GjsxUuhPw3BlrzazF6ghq4L_o9EW8dmYX6Xv5KnMTyPRI9inVd0D53rJOJgUhS1u9y.ZPEkEnE0Iv7DUFI0Vr6ZDA==";
    bullet.servers.push_back(InstanceServer{"wss://ws-api-futures.kucoin.com/endpoint", ping, 10000ms});
    return bullet;
}

}  // namespace

// ============================================================================
// Protocol frames
// ============================================================================

TEST(FeedProtocolTest, SubscriptionTopics) {
    const auto topics = subscription_topics(Symbol("SOLUSDTM"));
    EXPECT_EQ(topics[0], "/contractMarket/execution:SOLUSDTM");
    EXPECT_EQ(topics[1], "/contractMarket/tickerV2:SOLUSDTM");
    EXPECT_EQ(topics[2], "/contract/instrument:SOLUSDTM");
}

TEST(FeedProtocolTest, SubscribeFrame) {
    EXPECT_EQ(make_subscribe_frame("/contractMarket/tickerV2:SOLUSDTM", "17000000000001"),
              R"({"id":"17000000000001","type":"subscribe","topic":"/contractMarket/tickerV2:SOLUSDTM",)"
              R"("privateChannel":false,"response":true})");
}

TEST(FeedProtocolTest, PingFrame) {
    EXPECT_EQ(make_ping_frame("42"), R"({"id":"42","type":"ping"})");
}

TEST(FeedProtocolTest, EndpointCarriesTokenAndConnectId) {
    BulletToken bullet = sample_token();
    bullet.token = "abc+/=";

    const auto endpoint = make_feed_endpoint(bullet, "c1", 20000ms);
    EXPECT_EQ(endpoint.host, "ws-api-futures.kucoin.com");
    EXPECT_EQ(endpoint.port, "443");
    EXPECT_EQ(endpoint.target, "/endpoint?token=abc%2B%2F%3D&connectId=c1");
}

TEST(FeedProtocolTest, EndpointAppendsToExistingQuery) {
    BulletToken bullet = sample_token();
    bullet.token = "t";
    bullet.servers[0].endpoint = "wss://host.example/endpoint?region=eu";

    EXPECT_EQ(make_feed_endpoint(bullet, "c2", 20000ms).target,
              "/endpoint?region=eu&token=t&connectId=c2");
}

TEST(FeedProtocolTest, HeartbeatUsesShorterOfConfigAndServer) {
    EXPECT_EQ(make_feed_endpoint(sample_token(18000ms), "c", 20000ms).heartbeat_interval, 18000ms);
    EXPECT_EQ(make_feed_endpoint(sample_token(30000ms), "c", 20000ms).heartbeat_interval, 20000ms);
    EXPECT_EQ(make_feed_endpoint(sample_token(0ms), "c", 20000ms).heartbeat_interval, 20000ms);
}

TEST(FeedProtocolTest, EndpointWithoutServersThrows) {
    BulletToken bullet;
    bullet.token = "t";
    EXPECT_THROW((void)make_feed_endpoint(bullet, "c", 20000ms), TransportError);
}

// ============================================================================
// Feed lifecycle
// ============================================================================

TEST(MarketFeedTest, TokenFailureRetriesWithBackoff) {
    std::atomic<int> token_requests{0};
    MarketFeed feed(
        network::WebSocketConfig{},
        [&token_requests]() -> BulletToken {
            ++token_requests;
            throw TransportError("bullet-public unavailable");
        },
        utils::make_null_logger());

    std::promise<std::chrono::seconds> first_delay;
    std::atomic<bool> reported{false};
    feed.set_reconnect_callback([&](size_t attempt, std::chrono::seconds delay) {
        if (attempt == 1 && !reported.exchange(true)) {
            first_delay.set_value(delay);
        }
    });

    auto future = first_delay.get_future();
    auto handle = feed.connect(Symbol("SOLUSDTM"), [](const MarketEvent&) {});
    ASSERT_NE(handle, nullptr);

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(future.get(), 5s);
    EXPECT_EQ(token_requests.load(), 1);
    EXPECT_FALSE(handle->is_connected());
    EXPECT_EQ(handle->reconnect_count(), 1u);
    EXPECT_EQ(handle->events_delivered(), 0u);

    handle->stop();
    handle->stop();
}

// ============================================================================
// Frame handling
// ============================================================================

class MarketFeedFrameTest : public ::testing::Test {
protected:
    void SetUp() override {
        feed.set_client_factory([this](const network::WebSocketConfig&,
                                       network::IWebSocketClient::EndpointProvider provider) {
            auto client = std::make_unique<FakeWebSocketClient>(std::move(provider));
            fake = client.get();
            return client;
        });
        handle = feed.connect(Symbol("SOLUSDTM"), [this](const MarketEvent& event) { events.push_back(event); });
        ASSERT_NE(fake, nullptr);
    }

    MarketFeed feed{network::WebSocketConfig{}, [] { return sample_token(); }, utils::make_null_logger()};
    FakeWebSocketClient* fake = nullptr;
    std::unique_ptr<FeedHandle> handle;
    std::vector<MarketEvent> events;
};

TEST_F(MarketFeedFrameTest, StartsClientWithTokenEndpoint) {
    EXPECT_TRUE(fake->started);
    EXPECT_TRUE(handle->is_connected());

    const auto endpoint = fake->endpoint_provider();
    EXPECT_EQ(endpoint.host, "ws-api-futures.kucoin.com");
    EXPECT_EQ(endpoint.target.rfind("/endpoint?token=", 0), 0u);
    EXPECT_NE(endpoint.target.find("&connectId="), std::string::npos);
    EXPECT_EQ(endpoint.heartbeat_interval, 18000ms);

    ASSERT_TRUE(fake->heartbeat);
    EXPECT_NE(fake->heartbeat().find(R"("type":"ping")"), std::string::npos);
}

TEST_F(MarketFeedFrameTest, SubscribesOnlyAfterWelcome) {
    fake->receive(R"({"id":"1","type":"ack"})");
    EXPECT_TRUE(fake->sent.empty());

    fake->receive(R"({"id":"hQvf8jkno","type":"welcome"})");
    ASSERT_EQ(fake->sent.size(), 3u);

    const auto topics = subscription_topics(Symbol("SOLUSDTM"));
    for (size_t i = 0; i < topics.size(); ++i) {
        EXPECT_NE(fake->sent[i].find(R"("type":"subscribe")"), std::string::npos);
        EXPECT_NE(fake->sent[i].find("\"topic\":\"" + topics[i] + "\""), std::string::npos);
    }

    fake->receive(R"({"id":"2","type":"ack"})");
    EXPECT_EQ(fake->sent.size(), 3u);
}

TEST_F(MarketFeedFrameTest, DeliversEventsAndCountsMalformed) {
    fake->receive(R"({"id":"hQvf8jkno","type":"welcome"})");
    fake->receive(R"({"id":"1","type":"ack"})");
    fake->receive(
        R"({"type":"message","topic":"/contractMarket/tickerV2:SOLUSDTM","subject":"tickerV2",)"
        R"("data":{"symbol":"SOLUSDTM","bestBidSize":795,"bestBidPrice":"145.12",)"
        R"("bestAskPrice":"145.15","bestAskSize":614,"ts":1700000000123456789}})");
    fake->receive("{not json");
    fake->receive(R"({"type":"message","topic":"/contractMarket/level2:SOLUSDTM","subject":"level2","data":{}})");

    ASSERT_EQ(events.size(), 1u);
    const auto* ticker = std::get_if<TickerUpdate>(&events[0]);
    ASSERT_NE(ticker, nullptr);
    EXPECT_DOUBLE_EQ(ticker->bid_price, 145.12);
    EXPECT_DOUBLE_EQ(ticker->ask_price, 145.15);

    EXPECT_EQ(handle->events_delivered(), 1u);
    EXPECT_EQ(handle->frames_dropped(), 1u);
}

TEST_F(MarketFeedFrameTest, StopReachesClient) {
    handle->stop();
    EXPECT_EQ(fake->stop_calls, 1);
}
