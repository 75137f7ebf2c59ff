#pragma once
// ============================================================================
// PULSE TRADE BOT - REST Client
// ============================================================================
// HTTPS client over Boost.Beast. Every request runs on a private io_context
// with per-stage stream deadlines, so a call can never block longer than
// connect_timeout + request_timeout. Request signing is the caller's job.
// ============================================================================

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace pulse::network {

// ============================================================================
// HTTP Types
// ============================================================================

enum class HttpMethod {
    GET,
    POST
};

[[nodiscard]] std::string_view to_string(HttpMethod method) noexcept;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string path;
    std::map<std::string, std::string> query_params;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status_code = 0;
    std::string body;

    [[nodiscard]] bool is_unauthorized() const { return status_code == 401 || status_code == 403; }
};

/// Path plus URL-encoded query string, exactly as sent on the request line
[[nodiscard]] std::string build_target(const HttpRequest& request);

[[nodiscard]] std::string url_encode(std::string_view value);

// ============================================================================
// REST Client Configuration
// ============================================================================

struct RestClientConfig {
    std::string host = "api-futures.kucoin.com";
    std::string port = "443";
    std::string user_agent = "PulseTrade/1.0";

    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds request_timeout{10};

    bool verify_tls = true;

    // Client-side pacing (sliding window)
    int max_requests_per_window = 30;
    std::chrono::seconds rate_window{3};
};

// ============================================================================
// REST Client Interface
// ============================================================================

class IRestClient {
public:
    virtual ~IRestClient() = default;

    /// Blocking request. Throws TransportError on network failure or timeout.
    /// Non-2xx statuses are returned, not thrown.
    [[nodiscard]] virtual HttpResponse request(const HttpRequest& request) = 0;
};

// ============================================================================
// REST Client Implementation
// ============================================================================

class RestClient : public IRestClient {
public:
    explicit RestClient(const RestClientConfig& config);
    ~RestClient() override;

    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    [[nodiscard]] HttpResponse request(const HttpRequest& request) override;

    [[nodiscard]] const RestClientConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Rate Limiter
// ============================================================================

class RateLimiter {
public:
    RateLimiter(int max_requests, std::chrono::seconds window);
    ~RateLimiter();

    /// Wait until a permit is available, then acquire.
    void acquire();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace pulse::network
