#pragma once
// ============================================================================
// PULSE TRADE BOT - WebSocket Client
// ============================================================================
// Async TLS WebSocket client using Boost.Beast, driven by its own I/O thread.
// Features: endpoint re-resolution per attempt, exponential reconnect
// backoff, application-level heartbeat, generation-guarded callbacks.
// ============================================================================

#include <spdlog/logger.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace pulse::network {

// ============================================================================
// Endpoint
// ============================================================================

struct WebSocketEndpoint {
    std::string host;
    std::string port = "443";
    std::string target = "/";  // path + query

    // 0 = use WebSocketConfig::heartbeat_interval
    std::chrono::milliseconds heartbeat_interval{0};
};

/// Split "wss://host[:port]/path?query" into an endpoint. Throws TransportError.
[[nodiscard]] WebSocketEndpoint parse_wss_url(std::string_view url);

// ============================================================================
// WebSocket Client Configuration
// ============================================================================

struct WebSocketConfig {
    // Connection settings
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds idle_timeout{60};  // no inbound data for this long = dead socket

    // Reconnection settings
    bool auto_reconnect = true;
    std::chrono::seconds reconnect_initial{5};
    std::chrono::seconds reconnect_max{60};
    std::chrono::seconds stable_connection_threshold{30};

    // Heartbeat
    std::chrono::milliseconds heartbeat_interval{20000};

    bool verify_tls = true;
    std::string user_agent = "PulseTrade/1.0";
};

/// Backoff schedule: initial, doubled per failure, capped; back to initial
/// after a connection that stayed up for the stable threshold.
class ReconnectBackoff {
public:
    ReconnectBackoff(std::chrono::seconds initial, std::chrono::seconds max) noexcept
        : initial_(initial), max_(max), next_(initial) {}

    /// Delay for the coming attempt, advancing the schedule
    std::chrono::seconds next() noexcept {
        const auto delay = next_;
        next_ = std::min(next_ * 2, max_);
        return delay;
    }

    void reset() noexcept { next_ = initial_; }

    [[nodiscard]] std::chrono::seconds peek() const noexcept { return next_; }

private:
    std::chrono::seconds initial_;
    std::chrono::seconds max_;
    std::chrono::seconds next_;
};

// ============================================================================
// WebSocket Client Interface
// ============================================================================

class IWebSocketClient {
public:
    using MessageCallback = std::function<void(std::string_view)>;
    using ErrorCallback = std::function<void(const std::string&)>;
    using ConnectCallback = std::function<void()>;
    using DisconnectCallback = std::function<void()>;
    using ReconnectCallback = std::function<void(size_t attempt, std::chrono::seconds delay)>;

    /// Called on the I/O thread before every attempt; throwing fails the attempt
    using EndpointProvider = std::function<WebSocketEndpoint()>;

    /// Text frame sent on each heartbeat tick; empty provider = protocol ping
    using HeartbeatProvider = std::function<std::string()>;

    virtual ~IWebSocketClient() = default;

    /// Start the I/O thread and the first connection attempt
    virtual void start() = 0;

    /// Idempotent, callable from any thread
    virtual void stop() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
    [[nodiscard]] virtual size_t reconnect_count() const = 0;

    /// Queue a text frame. Dropped if not connected when it reaches the I/O thread.
    virtual void send(std::string message) = 0;

    virtual void on_message(MessageCallback callback) = 0;
    virtual void on_error(ErrorCallback callback) = 0;
    virtual void on_connect(ConnectCallback callback) = 0;
    virtual void on_disconnect(DisconnectCallback callback) = 0;
    virtual void on_reconnect(ReconnectCallback callback) = 0;
    virtual void set_heartbeat(HeartbeatProvider provider) = 0;
};

// ============================================================================
// WebSocket Client Implementation
// ============================================================================

class WebSocketClient : public IWebSocketClient {
public:
    WebSocketClient(const WebSocketConfig& config, EndpointProvider endpoint_provider,
                    std::shared_ptr<spdlog::logger> logger);
    ~WebSocketClient() override;

    // Non-copyable, non-movable (due to std::atomic members)
    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;
    WebSocketClient(WebSocketClient&&) = delete;
    WebSocketClient& operator=(WebSocketClient&&) = delete;

    void start() override;
    void stop() override;
    [[nodiscard]] bool is_connected() const override;
    void send(std::string message) override;

    // Set before start()
    void on_message(MessageCallback callback) override { on_message_ = std::move(callback); }
    void on_error(ErrorCallback callback) override { on_error_ = std::move(callback); }
    void on_connect(ConnectCallback callback) override { on_connect_ = std::move(callback); }
    void on_disconnect(DisconnectCallback callback) override { on_disconnect_ = std::move(callback); }
    void on_reconnect(ReconnectCallback callback) override { on_reconnect_ = std::move(callback); }
    void set_heartbeat(HeartbeatProvider provider) override { heartbeat_ = std::move(provider); }

    [[nodiscard]] size_t reconnect_count() const override { return reconnect_count_.load(); }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    // Callbacks
    MessageCallback on_message_;
    ErrorCallback on_error_;
    ConnectCallback on_connect_;
    DisconnectCallback on_disconnect_;
    ReconnectCallback on_reconnect_;
    HeartbeatProvider heartbeat_;

    // State
    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> generation_{0};
    std::atomic<size_t> reconnect_count_{0};
    std::thread io_thread_;
};

}  // namespace pulse::network
