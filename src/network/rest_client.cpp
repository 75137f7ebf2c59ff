// ============================================================================
// PULSE TRADE BOT - REST Client Implementation
// ============================================================================
// Boost.Beast HTTPS client: resolve -> connect -> TLS handshake -> write ->
// read -> shutdown, each stage under a tcp_stream deadline.
// ============================================================================

#include "pulse/network/rest_client.hpp"
#include "pulse/core/errors.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>

#include <algorithm>
#include <cctype>
#include <deque>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace pulse::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::GET:  return "GET";
        case HttpMethod::POST: return "POST";
    }
    return "GET";
}

std::string url_encode(std::string_view value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

std::string build_target(const HttpRequest& request) {
    std::string target = request.path;
    bool first = true;
    for (const auto& [key, value] : request.query_params) {
        target += first ? '?' : '&';
        target += url_encode(key);
        target += '=';
        target += url_encode(value);
        first = false;
    }
    return target;
}

namespace {

http::verb to_verb(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::GET:  return http::verb::get;
        case HttpMethod::POST: return http::verb::post;
    }
    return http::verb::get;
}

// ============================================================================
// One HTTPS exchange on a private io_context
// ============================================================================

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(net::io_context& ioc, ssl::context& ctx, const RestClientConfig& config)
        : resolver_(ioc), stream_(ioc, ctx), config_(config) {}

    void run(http::request<http::string_body> req) {
        req_ = std::move(req);

        if (!SSL_set_tlsext_host_name(stream_.native_handle(), config_.host.c_str())) {
            fail(beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                 "SNI");
            return;
        }
        if (config_.verify_tls) {
            stream_.set_verify_callback(ssl::host_name_verification(config_.host));
        }

        resolver_.async_resolve(config_.host, config_.port,
            beast::bind_front_handler(&Session::on_resolve, shared_from_this()));
    }

    [[nodiscard]] bool completed() const noexcept { return completed_; }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }
    [[nodiscard]] http::response<http::string_body>& response() noexcept { return res_; }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");

        beast::get_lowest_layer(stream_).expires_after(config_.connect_timeout);
        beast::get_lowest_layer(stream_).async_connect(results,
            beast::bind_front_handler(&Session::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return fail(ec, "connect");

        beast::get_lowest_layer(stream_).expires_after(config_.connect_timeout);
        stream_.async_handshake(ssl::stream_base::client,
            beast::bind_front_handler(&Session::on_handshake, shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "TLS handshake");

        beast::get_lowest_layer(stream_).expires_after(config_.request_timeout);
        http::async_write(stream_, req_,
            beast::bind_front_handler(&Session::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) return fail(ec, "write");

        http::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) return fail(ec, "read");

        completed_ = true;

        // Best-effort close; the response is already complete
        beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(2));
        stream_.async_shutdown(
            beast::bind_front_handler(&Session::on_shutdown, shared_from_this()));
    }

    void on_shutdown(beast::error_code) {
        // eof / stream_truncated are the usual outcomes here
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().close(ignored);
    }

    void fail(beast::error_code ec, const char* what) {
        error_ = std::string(what) + " failed: " + ec.message();
    }

    tcp::resolver resolver_;
    beast::ssl_stream<beast::tcp_stream> stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    const RestClientConfig& config_;

    bool completed_ = false;
    std::string error_;
};

}  // namespace

// ============================================================================
// REST Client Implementation
// ============================================================================

struct RestClient::Impl {
    explicit Impl(const RestClientConfig& config)
        : config_(config)
        , ssl_context_(ssl::context::tlsv12_client)
        , limiter_(config.max_requests_per_window, config.rate_window) {
        ssl_context_.set_default_verify_paths();
        ssl_context_.set_verify_mode(config_.verify_tls ? ssl::verify_peer : ssl::verify_none);
    }

    HttpResponse request(const HttpRequest& req) {
        limiter_.acquire();

        http::request<http::string_body> http_req;
        http_req.version(11);
        http_req.method(to_verb(req.method));
        http_req.target(build_target(req));
        http_req.set(http::field::host, config_.host);
        http_req.set(http::field::user_agent, config_.user_agent);
        http_req.set(http::field::content_type, "application/json");
        for (const auto& [name, value] : req.headers) {
            http_req.set(name, value);
        }
        if (!req.body.empty()) {
            http_req.body() = req.body;
        }
        http_req.prepare_payload();

        net::io_context ioc;
        auto session = std::make_shared<Session>(ioc, ssl_context_, config_);
        session->run(std::move(http_req));

        // The resolver has no deadline of its own; bound the whole exchange
        ioc.run_for(config_.connect_timeout * 2 + config_.request_timeout);

        if (!session->error().empty()) {
            throw TransportError(std::string(to_string(req.method)) + " " + req.path + ": " +
                                 session->error());
        }
        if (!session->completed()) {
            throw TransportError(std::string(to_string(req.method)) + " " + req.path +
                                 ": request timed out");
        }

        auto& http_res = session->response();
        HttpResponse response;
        response.status_code = static_cast<int>(http_res.result_int());
        response.body = std::move(http_res.body());
        return response;
    }

    RestClientConfig config_;
    ssl::context ssl_context_;
    RateLimiter limiter_;
};

// ============================================================================
// RestClient Public Interface
// ============================================================================

RestClient::RestClient(const RestClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

RestClient::~RestClient() = default;

HttpResponse RestClient::request(const HttpRequest& request) {
    return impl_->request(request);
}

const RestClientConfig& RestClient::config() const noexcept {
    return impl_->config_;
}

// ============================================================================
// Rate Limiter Implementation
// ============================================================================

struct RateLimiter::Impl {
    int max_requests_;
    std::chrono::seconds window_;
    std::deque<std::chrono::steady_clock::time_point> requests_;
    mutable std::mutex mutex_;

    Impl(int max_requests, std::chrono::seconds window)
        : max_requests_(max_requests), window_(window) {}

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        cleanup_old_requests();

        if (static_cast<int>(requests_.size()) >= max_requests_) {
            return false;
        }

        requests_.push_back(std::chrono::steady_clock::now());
        return true;
    }

    void acquire() {
        while (!try_acquire()) {
            const auto wait = std::max(time_until_reset(), std::chrono::milliseconds(10));
            std::this_thread::sleep_for(wait);
        }
    }

    std::chrono::milliseconds time_until_reset() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            return std::chrono::milliseconds(0);
        }

        const auto reset_time = requests_.front() + window_;
        const auto now = std::chrono::steady_clock::now();

        if (reset_time <= now) {
            return std::chrono::milliseconds(0);
        }

        return std::chrono::duration_cast<std::chrono::milliseconds>(reset_time - now);
    }

private:
    void cleanup_old_requests() {
        const auto cutoff = std::chrono::steady_clock::now() - window_;
        while (!requests_.empty() && requests_.front() < cutoff) {
            requests_.pop_front();
        }
    }
};

RateLimiter::RateLimiter(int max_requests, std::chrono::seconds window)
    : impl_(std::make_unique<Impl>(max_requests, window)) {}

RateLimiter::~RateLimiter() = default;

void RateLimiter::acquire() {
    impl_->acquire();
}

}  // namespace pulse::network
