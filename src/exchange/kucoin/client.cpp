// ============================================================================
// PULSE TRADE BOT - KuCoin Futures Client Implementation
// ============================================================================
// Every response is wrapped in {"code": "200000", "data": ...}. Any other
// code is a rejection; 400001-400005 are credential problems.
// ============================================================================

#include "pulse/exchange/kucoin/client.hpp"
#include "pulse/core/errors.hpp"

#include <simdjson.h>

#include <mutex>
#include <sstream>
#include <stdexcept>

namespace pulse::exchange::kucoin {

namespace {

using simdjson::ondemand::json_type;

constexpr std::string_view PATH_BULLET_PUBLIC = "/api/v1/bullet-public";
constexpr std::string_view PATH_POSITION = "/api/v1/position";
constexpr std::string_view PATH_LEVERAGE = "/api/v2/changeCrossUserLeverage";
constexpr std::string_view PATH_ORDERS = "/api/v1/orders";

bool is_auth_code(std::string_view code) noexcept {
    return code == "400001" || code == "400002" || code == "400003" ||
           code == "400004" || code == "400005";
}

double read_number(simdjson::ondemand::value& value) {
    switch (json_type(value.type())) {
        case json_type::number:
            return double(value.get_double());
        case json_type::string: {
            std::string_view text = value.get_string();
            return text.empty() ? 0.0 : std::stod(std::string(text));
        }
        case json_type::null:
            return 0.0;
        default:
            throw std::invalid_argument("expected a number");
    }
}

std::string read_code(simdjson::ondemand::document& doc) {
    simdjson::ondemand::value code = doc["code"];
    if (json_type(code.type()) == json_type::string) {
        return std::string(std::string_view(code.get_string()));
    }
    return std::to_string(int64_t(code.get_int64()));
}

std::string format_size(double size) {
    std::ostringstream ss;
    ss << size;
    return ss.str();
}

}  // namespace

// ============================================================================
// KuCoin Client Implementation
// ============================================================================

struct KucoinClient::Impl {
    KucoinConfig config_;
    std::unique_ptr<network::IRestClient> rest_;
    std::shared_ptr<spdlog::logger> logger_;

    // Shared by the executor thread and the feed's token fetch
    simdjson::ondemand::parser parser_;
    std::mutex parser_mutex_;

    Impl(const KucoinConfig& config, std::unique_ptr<network::IRestClient> rest,
         std::shared_ptr<spdlog::logger> logger)
        : config_(config), rest_(std::move(rest)), logger_(std::move(logger)) {}

    network::HttpResponse send(network::HttpRequest request, bool sign) {
        if (sign) {
            if (!config_.credentials.complete()) {
                throw AuthError("KuCoin API credentials are not configured");
            }
            sign_request(request, config_.credentials, to_epoch_ms(now()));
        }
        logger_->debug("{} {}", network::to_string(request.method), network::build_target(request));
        return rest_->request(request);
    }

    /// Validate the envelope and hand `data` to `on_data`
    template <typename Fn>
    decltype(auto) parse(const network::HttpResponse& response, std::string_view what, Fn&& on_data) {
        if (response.is_unauthorized()) {
            throw AuthError(std::string(what) + ": HTTP " + std::to_string(response.status_code));
        }

        std::lock_guard<std::mutex> lock(parser_mutex_);
        try {
            simdjson::padded_string padded(response.body);
            simdjson::ondemand::document doc = parser_.iterate(padded);

            const std::string code = read_code(doc);
            if (code != SUCCESS_CODE) {
                std::string_view msg;
                if (doc["msg"].get_string().get(msg) != simdjson::SUCCESS) {
                    msg = {};
                }
                if (is_auth_code(code)) {
                    throw AuthError(std::string(what) + ": " + std::string(msg) + " (code " + code + ")");
                }
                throw OrderExecutionError(
                    std::string(what) + " rejected: " + std::string(msg) + " (code " + code + ")", code);
            }

            simdjson::ondemand::value data = doc["data"];
            return on_data(data);
        } catch (const simdjson::simdjson_error& e) {
            throw OrderExecutionError(std::string(what) + ": unexpected response (HTTP " +
                                      std::to_string(response.status_code) + "): " + e.what());
        } catch (const std::logic_error& e) {
            throw OrderExecutionError(std::string(what) + ": bad number in response: " + e.what());
        }
    }

    // ========================================================================
    // Order Side
    // ========================================================================

    std::optional<Position> get_position(const Symbol& symbol) {
        network::HttpRequest req;
        req.method = network::HttpMethod::GET;
        req.path = std::string(PATH_POSITION);
        req.query_params["symbol"] = symbol.str();

        auto response = send(std::move(req), true);
        return parse(response, "get position", [&symbol](simdjson::ondemand::value& data)
                                                   -> std::optional<Position> {
            if (bool(data.is_null())) {
                return std::nullopt;
            }
            Position position;
            position.symbol = symbol;
            for (simdjson::ondemand::field field : data.get_object()) {
                std::string_view key = field.unescaped_key();
                if (key == "currentQty") position.quantity = read_number(field.value());
                else if (key == "realLeverage") position.leverage = read_number(field.value());
            }
            return position;
        });
    }

    void set_leverage(const Symbol& symbol, int leverage) {
        network::HttpRequest req;
        req.method = network::HttpMethod::POST;
        req.path = std::string(PATH_LEVERAGE);
        req.body = "{\"symbol\":\"" + symbol.str() + "\",\"leverage\":\"" + std::to_string(leverage) + "\"}";

        auto response = send(std::move(req), true);
        const bool accepted = parse(response, "set leverage", [](simdjson::ondemand::value& data) {
            if (json_type(data.type()) == json_type::boolean) {
                return bool(data.get_bool());
            }
            return !bool(data.is_null());
        });
        if (!accepted) {
            throw OrderExecutionError("set leverage " + std::to_string(leverage) + " on " +
                                      symbol.str() + " was not accepted");
        }
    }

    OrderResult submit_order(const std::string& body, OrderResult result, std::string_view what) {
        network::HttpRequest req;
        req.method = network::HttpMethod::POST;
        req.path = std::string(PATH_ORDERS);
        req.body = body;

        auto response = send(std::move(req), true);
        result.order_id = parse(response, what, [](simdjson::ondemand::value& data) {
            std::string order_id;
            for (simdjson::ondemand::field field : data.get_object()) {
                std::string_view key = field.unescaped_key();
                if (key == "orderId") {
                    order_id = std::string(std::string_view(field.value().get_string()));
                }
            }
            return order_id;
        });
        result.submitted_at = now();
        return result;
    }

    OrderResult place_order(const OrderRequest& request) {
        std::ostringstream body;
        body << "{\"clientOid\":\"" << request.client_order_id << "\""
             << ",\"side\":\"" << to_string(request.side) << "\""
             << ",\"symbol\":\"" << request.symbol.view() << "\""
             << ",\"type\":\"market\""
             << ",\"leverage\":" << request.leverage
             << ",\"size\":" << format_size(request.size) << "}";

        OrderResult result;
        result.client_order_id = request.client_order_id;
        result.symbol = request.symbol;
        result.side = request.side;
        result.size = request.size;

        result = submit_order(body.str(), std::move(result), "place order");
        logger_->info("Order placed: {} {} {} x{} (orderId={}, clientOid={})",
                      to_string(request.side), format_size(request.size), request.symbol.view(),
                      request.leverage, result.order_id, result.client_order_id);
        return result;
    }

    OrderResult close_position(const Symbol& symbol, const std::string& client_order_id) {
        const auto position = get_position(symbol);
        if (!position || position->is_flat()) {
            throw OrderExecutionError("no open position on " + symbol.str(), {}, true);
        }

        const std::string body = "{\"clientOid\":\"" + client_order_id + "\",\"symbol\":\"" +
                                 symbol.str() + "\",\"type\":\"market\",\"closeOrder\":true}";

        OrderResult result;
        result.client_order_id = client_order_id;
        result.symbol = symbol;
        result.side = position->is_long() ? Side::Sell : Side::Buy;
        result.size = position->is_long() ? position->quantity : -position->quantity;
        result.close_order = true;

        result = submit_order(body, std::move(result), "close position");
        logger_->info("Position closed: {} {} (orderId={})", symbol.view(),
                      format_size(position->quantity), result.order_id);
        return result;
    }

    // ========================================================================
    // Websocket Bootstrap
    // ========================================================================

    BulletToken request_public_token() {
        network::HttpRequest req;
        req.method = network::HttpMethod::POST;
        req.path = std::string(PATH_BULLET_PUBLIC);

        auto response = send(std::move(req), false);
        BulletToken bullet;
        try {
            bullet = parse(response, "bullet-public", [](simdjson::ondemand::value& data) {
                BulletToken token;
                for (simdjson::ondemand::field field : data.get_object()) {
                    std::string_view key = field.unescaped_key();
                    if (key == "token") {
                        token.token = std::string(std::string_view(field.value().get_string()));
                    } else if (key == "instanceServers") {
                        for (auto server_value : field.value().get_array()) {
                            simdjson::ondemand::object server = server_value.get_object();
                            InstanceServer instance;
                            for (simdjson::ondemand::field sf : server) {
                                std::string_view skey = sf.unescaped_key();
                                if (skey == "endpoint") {
                                    instance.endpoint = std::string(std::string_view(sf.value().get_string()));
                                } else if (skey == "pingInterval") {
                                    instance.ping_interval = std::chrono::milliseconds(int64_t(sf.value().get_int64()));
                                } else if (skey == "pingTimeout") {
                                    instance.ping_timeout = std::chrono::milliseconds(int64_t(sf.value().get_int64()));
                                }
                            }
                            token.servers.push_back(std::move(instance));
                        }
                    }
                }
                return token;
            });
        } catch (const OrderExecutionError& e) {
            throw TransportError(e.what());
        }

        if (bullet.token.empty() || bullet.servers.empty() || bullet.servers.front().endpoint.empty()) {
            throw TransportError("bullet-public returned no token or instance server");
        }
        return bullet;
    }
};

// ============================================================================
// KucoinClient Public Interface
// ============================================================================

namespace {

std::unique_ptr<network::IRestClient> make_rest_client(const KucoinConfig& config) {
    network::RestClientConfig rest_config;
    rest_config.host = config.rest_host();
    rest_config.request_timeout = config.request_timeout;
    return std::make_unique<network::RestClient>(rest_config);
}

}  // namespace

KucoinClient::KucoinClient(const KucoinConfig& config, std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_unique<Impl>(config, make_rest_client(config), std::move(logger))) {}

KucoinClient::KucoinClient(const KucoinConfig& config, std::unique_ptr<network::IRestClient> rest,
                           std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_unique<Impl>(config, std::move(rest), std::move(logger))) {}

KucoinClient::~KucoinClient() = default;

std::optional<Position> KucoinClient::get_position(const Symbol& symbol) {
    return impl_->get_position(symbol);
}

void KucoinClient::set_leverage(const Symbol& symbol, int leverage) {
    impl_->set_leverage(symbol, leverage);
}

OrderResult KucoinClient::close_position(const Symbol& symbol, const std::string& client_order_id) {
    return impl_->close_position(symbol, client_order_id);
}

OrderResult KucoinClient::place_order(const OrderRequest& request) {
    return impl_->place_order(request);
}

BulletToken KucoinClient::request_public_token() {
    return impl_->request_public_token();
}

}  // namespace pulse::exchange::kucoin
