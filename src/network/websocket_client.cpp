// ============================================================================
// PULSE TRADE BOT - WebSocket Client Implementation
// ============================================================================
// Boost.Beast SSL WebSocket client with backoff reconnect.
// All socket state lives on the I/O thread; public calls post onto it.
// Every attempt gets a generation number and handlers from an older
// generation return without touching state.
// ============================================================================

#include "pulse/network/websocket_client.hpp"
#include "pulse/core/errors.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <deque>
#include <optional>

namespace pulse::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// ============================================================================
// URL Parsing
// ============================================================================

WebSocketEndpoint parse_wss_url(std::string_view url) {
    constexpr std::string_view scheme = "wss://";
    if (url.substr(0, scheme.size()) != scheme) {
        throw TransportError("unsupported websocket url: " + std::string(url));
    }
    url.remove_prefix(scheme.size());

    WebSocketEndpoint endpoint;
    const auto path_pos = url.find_first_of("/?");
    std::string_view authority = url.substr(0, path_pos);
    if (path_pos != std::string_view::npos) {
        endpoint.target = std::string(url.substr(path_pos));
        if (endpoint.target.front() == '?') {
            endpoint.target.insert(endpoint.target.begin(), '/');
        }
    }

    const auto colon = authority.find(':');
    if (colon != std::string_view::npos) {
        endpoint.port = std::string(authority.substr(colon + 1));
        authority = authority.substr(0, colon);
    }
    if (authority.empty() || endpoint.port.empty()) {
        throw TransportError("websocket url has no host: wss://" + std::string(url));
    }
    endpoint.host = std::string(authority);
    return endpoint;
}

// ============================================================================
// WebSocket Client Implementation
// ============================================================================

struct WebSocketClient::Impl {
    using ws_stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    Impl(const WebSocketConfig& config, EndpointProvider endpoint_provider,
         std::shared_ptr<spdlog::logger> logger)
        : config_(config)
        , endpoint_provider_(std::move(endpoint_provider))
        , logger_(std::move(logger))
        , io_context_(1)
        , ssl_context_(ssl::context::tlsv12_client)
        , resolver_(io_context_)
        , heartbeat_timer_(io_context_)
        , reconnect_timer_(io_context_)
        , backoff_(config.reconnect_initial, config.reconnect_max) {

        ssl_context_.set_default_verify_paths();
        ssl_context_.set_verify_mode(config_.verify_tls ? ssl::verify_peer : ssl::verify_none);
    }

    [[nodiscard]] bool is_current(uint64_t generation, WebSocketClient* self) const {
        return self->running_ && generation == self->generation_;
    }

    // ========================================================================
    // Connect Chain
    // ========================================================================

    void connect(WebSocketClient* self) {
        if (!self->running_) return;

        const uint64_t generation = ++self->generation_;
        read_buffer_.clear();
        write_queue_.clear();

        try {
            endpoint_ = endpoint_provider_();
        } catch (const std::exception& e) {
            handle_failure(generation, std::string("Endpoint lookup failed: ") + e.what(), self);
            return;
        }

        logger_->info("Connecting to {}:{}", endpoint_.host, endpoint_.port);

        ws_ = std::make_shared<ws_stream>(io_context_, ssl_context_);
        if (config_.verify_tls) {
            ws_->next_layer().set_verify_callback(ssl::host_name_verification(endpoint_.host));
        }

        resolver_.async_resolve(
            endpoint_.host,
            endpoint_.port,
            [this, self, generation, ws = ws_](beast::error_code ec, tcp::resolver::results_type results) {
                on_resolve(ec, results, generation, ws, self);
            });
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results, uint64_t generation,
                    std::shared_ptr<ws_stream> ws, WebSocketClient* self) {
        if (!is_current(generation, self)) return;
        if (ec) {
            handle_failure(generation, "Resolve failed: " + ec.message(), self);
            return;
        }

        beast::get_lowest_layer(*ws).expires_after(config_.connect_timeout);
        beast::get_lowest_layer(*ws).async_connect(
            results,
            [this, self, generation, ws](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                on_connect(ec, generation, ws, self);
            });
    }

    void on_connect(beast::error_code ec, uint64_t generation, std::shared_ptr<ws_stream> ws,
                    WebSocketClient* self) {
        if (!is_current(generation, self)) return;
        if (ec) {
            handle_failure(generation, "Connect failed: " + ec.message(), self);
            return;
        }

        // SNI
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), endpoint_.host.c_str())) {
            ec = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            handle_failure(generation, "SSL hostname failed: " + ec.message(), self);
            return;
        }

        beast::get_lowest_layer(*ws).expires_after(config_.connect_timeout);
        ws->next_layer().async_handshake(
            ssl::stream_base::client,
            [this, self, generation, ws](beast::error_code ec) {
                on_ssl_handshake(ec, generation, ws, self);
            });
    }

    void on_ssl_handshake(beast::error_code ec, uint64_t generation, std::shared_ptr<ws_stream> ws,
                          WebSocketClient* self) {
        if (!is_current(generation, self)) return;
        if (ec) {
            handle_failure(generation, "SSL handshake failed: " + ec.message(), self);
            return;
        }

        // The websocket layer owns timeouts from here on
        beast::get_lowest_layer(*ws).expires_never();

        websocket::stream_base::timeout timeouts;
        timeouts.handshake_timeout = config_.connect_timeout;
        timeouts.idle_timeout = config_.idle_timeout;
        timeouts.keep_alive_pings = true;
        ws->set_option(timeouts);

        ws->set_option(websocket::stream_base::decorator(
            [user_agent = config_.user_agent](websocket::request_type& req) {
                req.set(http::field::user_agent, user_agent);
            }));

        ws->async_handshake(
            endpoint_.host,
            endpoint_.target,
            [this, self, generation, ws](beast::error_code ec) {
                on_ws_handshake(ec, generation, ws, self);
            });
    }

    void on_ws_handshake(beast::error_code ec, uint64_t generation, std::shared_ptr<ws_stream> ws,
                         WebSocketClient* self) {
        if (!is_current(generation, self)) return;
        if (ec) {
            handle_failure(generation, "WebSocket handshake failed: " + ec.message(), self);
            return;
        }

        logger_->info("WebSocket connected to {}", endpoint_.host);

        self->connected_ = true;
        connected_at_ = std::chrono::steady_clock::now();

        if (self->on_connect_) {
            self->on_connect_();
        }

        do_read(generation, ws, self);
        start_heartbeat(generation, self);
    }

    // ========================================================================
    // Read Loop
    // ========================================================================

    void do_read(uint64_t generation, std::shared_ptr<ws_stream> ws, WebSocketClient* self) {
        ws->async_read(
            read_buffer_,
            [this, self, generation, ws](beast::error_code ec, std::size_t bytes_transferred) {
                on_read(ec, bytes_transferred, generation, ws, self);
            });
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred, uint64_t generation,
                 std::shared_ptr<ws_stream> ws, WebSocketClient* self) {
        if (!is_current(generation, self)) return;
        if (ec) {
            if (ec == websocket::error::closed) {
                handle_failure(generation, "Connection closed by server", self);
            } else {
                handle_failure(generation, "Read error: " + ec.message(), self);
            }
            return;
        }

        if (self->on_message_) {
            std::string message = beast::buffers_to_string(read_buffer_.data());
            try {
                self->on_message_(message);
            } catch (const std::exception& e) {
                logger_->error("Message handler threw: {}", e.what());
            }
        }

        read_buffer_.consume(bytes_transferred);

        // The handler may have stopped the client
        if (!is_current(generation, self)) return;
        do_read(generation, ws, self);
    }

    // ========================================================================
    // Write Queue (I/O thread only)
    // ========================================================================

    void send(std::string message, WebSocketClient* self) {
        if (!self->connected_ || !ws_) {
            logger_->debug("Dropping outbound frame while disconnected");
            return;
        }

        const bool write_in_progress = !write_queue_.empty();
        write_queue_.push_back(std::move(message));
        if (!write_in_progress) {
            do_write(self->generation_, self);
        }
    }

    void do_write(uint64_t generation, WebSocketClient* self) {
        if (write_queue_.empty()) return;

        ws_->text(true);
        ws_->async_write(
            net::buffer(write_queue_.front()),
            [this, self, generation, ws = ws_](beast::error_code ec, std::size_t) {
                on_write(ec, generation, self);
            });
    }

    void on_write(beast::error_code ec, uint64_t generation, WebSocketClient* self) {
        if (!is_current(generation, self)) return;
        if (ec) {
            handle_failure(generation, "Write error: " + ec.message(), self);
            return;
        }

        write_queue_.pop_front();
        do_write(generation, self);
    }

    // ========================================================================
    // Heartbeat
    // ========================================================================

    void start_heartbeat(uint64_t generation, WebSocketClient* self) {
        const auto interval = endpoint_.heartbeat_interval.count() > 0
            ? endpoint_.heartbeat_interval
            : config_.heartbeat_interval;

        heartbeat_timer_.expires_after(interval);
        heartbeat_timer_.async_wait([this, self, generation](beast::error_code ec) {
            if (ec || !is_current(generation, self) || !self->connected_) return;

            if (self->heartbeat_) {
                send(self->heartbeat_(), self);
            } else {
                ws_->async_ping({}, [](beast::error_code) {});
            }
            start_heartbeat(generation, self);
        });
    }

    // ========================================================================
    // Failure / Reconnect
    // ========================================================================

    void handle_failure(uint64_t generation, const std::string& error, WebSocketClient* self) {
        if (!is_current(generation, self)) return;

        // Anything still in flight for this attempt is now stale
        ++self->generation_;

        heartbeat_timer_.cancel();
        close_socket();

        const bool was_connected = self->connected_.exchange(false);
        logger_->warn("WebSocket: {}", error);
        if (self->on_error_) {
            self->on_error_(error);
        }
        if (was_connected && self->on_disconnect_) {
            self->on_disconnect_();
        }

        if (was_connected && connected_at_ &&
            std::chrono::steady_clock::now() - *connected_at_ >= config_.stable_connection_threshold) {
            backoff_.reset();
        }
        connected_at_.reset();

        schedule_reconnect(self);
    }

    void schedule_reconnect(WebSocketClient* self) {
        if (!config_.auto_reconnect || !self->running_) return;
        const auto delay = backoff_.next();
        const size_t attempt = ++self->reconnect_count_;
        logger_->info("Reconnecting in {}s (attempt {})", delay.count(), attempt);
        if (self->on_reconnect_) {
            self->on_reconnect_(attempt, delay);
        }

        reconnect_timer_.expires_after(delay);
        reconnect_timer_.async_wait([this, self](beast::error_code ec) {
            if (!ec && self->running_) {
                connect(self);
            }
        });
    }

    void close_socket() {
        resolver_.cancel();
        if (ws_) {
            beast::error_code ec;
            beast::get_lowest_layer(*ws_).socket().close(ec);
            ws_.reset();
        }
        write_queue_.clear();
    }

    /// Runs on the I/O thread
    void shutdown(WebSocketClient* self) {
        ++self->generation_;
        heartbeat_timer_.cancel();
        reconnect_timer_.cancel();
        close_socket();
        if (self->connected_.exchange(false) && self->on_disconnect_) {
            self->on_disconnect_();
        }
        work_guard_.reset();
        io_context_.stop();
    }

    // Members
    WebSocketConfig config_;
    EndpointProvider endpoint_provider_;
    std::shared_ptr<spdlog::logger> logger_;

    net::io_context io_context_;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work_guard_;
    ssl::context ssl_context_;
    tcp::resolver resolver_;

    WebSocketEndpoint endpoint_;
    std::shared_ptr<ws_stream> ws_;
    beast::flat_buffer read_buffer_;
    std::deque<std::string> write_queue_;

    net::steady_timer heartbeat_timer_;
    net::steady_timer reconnect_timer_;
    ReconnectBackoff backoff_;
    std::optional<std::chrono::steady_clock::time_point> connected_at_;
};

// ============================================================================
// WebSocketClient Public Interface
// ============================================================================

WebSocketClient::WebSocketClient(const WebSocketConfig& config, EndpointProvider endpoint_provider,
                                 std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_unique<Impl>(config, std::move(endpoint_provider), std::move(logger))) {}

WebSocketClient::~WebSocketClient() {
    stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

void WebSocketClient::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;

    impl_->work_guard_.emplace(impl_->io_context_.get_executor());
    net::post(impl_->io_context_, [this] { impl_->connect(this); });
    io_thread_ = std::thread([this]() {
        impl_->io_context_.run();
    });
}

void WebSocketClient::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) return;

    if (std::this_thread::get_id() == io_thread_.get_id()) {
        // Called from a callback; the owner joins in the destructor
        impl_->shutdown(this);
        return;
    }

    net::post(impl_->io_context_, [this] { impl_->shutdown(this); });
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

bool WebSocketClient::is_connected() const {
    return connected_;
}

void WebSocketClient::send(std::string message) {
    if (!running_) return;
    net::post(impl_->io_context_, [this, message = std::move(message)]() mutable {
        impl_->send(std::move(message), this);
    });
}

}  // namespace pulse::network
