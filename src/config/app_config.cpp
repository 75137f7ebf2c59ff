// ============================================================================
// PULSE TRADE BOT - Application Configuration
// ============================================================================

#include "pulse/config/app_config.hpp"
#include "pulse/core/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>

namespace pulse::config {

namespace {

void parse_document(const YAML::Node& yaml, AppConfig& config) {
    // Exchange
    if (const auto ex = yaml["exchange"]) {
        auto& creds = config.exchange.credentials;
        creds.api_key = ex["api_key"].as<std::string>(creds.api_key);
        creds.api_secret = ex["api_secret"].as<std::string>(creds.api_secret);
        creds.api_passphrase = ex["api_passphrase"].as<std::string>(creds.api_passphrase);

        const auto environment = ex["environment"].as<std::string>("live");
        if (environment != "live" && environment != "sandbox") {
            throw ConfigError("exchange.environment must be 'live' or 'sandbox', got '" +
                              environment + "'");
        }
        config.exchange.sandbox = environment == "sandbox";
    }

    // Trading
    if (const auto tr = yaml["trading"]) {
        auto& t = config.trading;
        t.enabled = tr["enabled"].as<bool>(t.enabled);
        t.symbol = tr["symbol"].as<std::string>(t.symbol);
        t.leverage = tr["leverage"].as<int>(t.leverage);
        t.position_size = tr["position_size"].as<double>(t.position_size);
    }

    // Strategy
    if (const auto st = yaml["strategy"]) {
        auto& s = config.strategy;
        s.rsi_lower = st["rsi_lower"].as<double>(s.rsi_lower);
        s.rsi_upper = st["rsi_upper"].as<double>(s.rsi_upper);
        s.signal_buffer_seconds = st["signal_buffer_seconds"].as<int64_t>(s.signal_buffer_seconds);
        s.max_history = st["max_history"].as<size_t>(s.max_history);
        s.require_confluence = st["require_confluence"].as<bool>(s.require_confluence);
    }

    // Feed
    if (const auto fd = yaml["feed"]) {
        auto& f = config.feed;
        f.ping_interval_seconds = fd["ping_interval_seconds"].as<int64_t>(f.ping_interval_seconds);
        f.reconnect_initial_seconds = fd["reconnect_initial_seconds"].as<int64_t>(f.reconnect_initial_seconds);
        f.reconnect_max_seconds = fd["reconnect_max_seconds"].as<int64_t>(f.reconnect_max_seconds);
        f.stable_connection_seconds = fd["stable_connection_seconds"].as<int64_t>(f.stable_connection_seconds);
        f.request_timeout_seconds = fd["request_timeout_seconds"].as<int64_t>(f.request_timeout_seconds);
    }

    // Logging
    if (const auto lg = yaml["logging"]) {
        auto& l = config.logging;
        if (lg["level"]) {
            l.level = utils::parse_log_level(lg["level"].as<std::string>());
        }
        l.log_file = lg["file"].as<std::string>(l.log_file);
        l.console = lg["console"].as<bool>(l.console);
        l.async = lg["async"].as<bool>(l.async);
        l.max_file_size_mb = lg["max_file_size_mb"].as<size_t>(l.max_file_size_mb);
        l.max_files = lg["max_files"].as<size_t>(l.max_files);
    }

    // Display
    if (const auto dp = yaml["display"]) {
        auto& d = config.display;
        d.enabled = dp["enabled"].as<bool>(d.enabled);
        d.candles = dp["candles"].as<size_t>(d.candles);
        d.color = dp["color"].as<bool>(d.color);
    }
}

template <typename T, typename Parse>
void override_from(const EnvLookup& lookup, const char* name, T& target, Parse&& parse) {
    const auto value = lookup(name);
    if (!value) return;
    try {
        target = parse(*value);
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " is not a valid number: '" + *value + "'");
    }
}

}  // namespace

// ============================================================================
// Validation
// ============================================================================

void AppConfig::validate() const {
    if (trading.enabled && !exchange.credentials.complete()) {
        throw ConfigError("trading is enabled but KuCoin API credentials are missing "
                          "(set KUCOIN_API_KEY, KUCOIN_API_SECRET, KUCOIN_API_PASSPHRASE)");
    }
    if (trading.symbol.empty() || trading.symbol.size() > 15) {
        throw ConfigError("trading.symbol must be 1-15 characters, got '" + trading.symbol + "'");
    }
    if (trading.leverage < 1 || trading.leverage > 100) {
        throw ConfigError("trading.leverage must be within [1, 100]");
    }
    if (!(trading.position_size > 0.0)) {
        throw ConfigError("trading.position_size must be positive");
    }
    if (!(strategy.rsi_lower >= 0.0 && strategy.rsi_upper <= 100.0)) {
        throw ConfigError("RSI thresholds must be within [0, 100]");
    }
    if (strategy.rsi_lower >= strategy.rsi_upper) {
        throw ConfigError("strategy.rsi_lower must be below strategy.rsi_upper");
    }
    if (strategy.signal_buffer_seconds < 0) {
        throw ConfigError("strategy.signal_buffer_seconds must not be negative");
    }
    if (strategy.max_history < 2) {
        throw ConfigError("strategy.max_history must be at least 2");
    }
    if (feed.ping_interval_seconds < 1 || feed.request_timeout_seconds < 1) {
        throw ConfigError("feed intervals must be at least 1 second");
    }
    if (feed.reconnect_initial_seconds < 1 || feed.reconnect_max_seconds < feed.reconnect_initial_seconds) {
        throw ConfigError("feed.reconnect_max_seconds must be >= reconnect_initial_seconds >= 1");
    }
}

// ============================================================================
// Loading
// ============================================================================

std::optional<std::string> system_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

AppConfig load_config(const std::string& path) {
    AppConfig config;
    if (!std::filesystem::exists(path)) {
        return config;
    }

    try {
        parse_document(YAML::LoadFile(path), config);
    } catch (const YAML::Exception& e) {
        throw ConfigError("config load failed (" + path + "): " + e.what());
    }
    return config;
}

AppConfig load_config_from_string(const std::string& yaml) {
    AppConfig config;
    try {
        parse_document(YAML::Load(yaml), config);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("config parse failed: ") + e.what());
    }
    return config;
}

void apply_env_overrides(AppConfig& config, const EnvLookup& lookup) {
    auto& creds = config.exchange.credentials;
    if (auto v = lookup("KUCOIN_API_KEY")) creds.api_key = *v;
    if (auto v = lookup("KUCOIN_API_SECRET")) creds.api_secret = *v;
    if (auto v = lookup("KUCOIN_API_PASSPHRASE")) creds.api_passphrase = *v;
    if (auto v = lookup("TRADING_PAIR")) config.trading.symbol = *v;

    override_from(lookup, "LEVERAGE", config.trading.leverage,
                  [](const std::string& s) { return std::stoi(s); });
    override_from(lookup, "POSITION_SIZE", config.trading.position_size,
                  [](const std::string& s) { return std::stod(s); });
}

}  // namespace pulse::config
