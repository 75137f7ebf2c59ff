#pragma once
// ============================================================================
// PULSE TRADE BOT - Application Configuration
// ============================================================================
// YAML file (yaml-cpp) with environment variable overrides:
//   KUCOIN_API_KEY, KUCOIN_API_SECRET, KUCOIN_API_PASSPHRASE,
//   TRADING_PAIR, LEVERAGE, POSITION_SIZE
// Missing keys keep their defaults; a missing file means all defaults.
// ============================================================================

#include "pulse/app/console_display.hpp"
#include "pulse/exchange/kucoin/auth.hpp"
#include "pulse/utils/logger.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace pulse::config {

struct ExchangeSettings {
    exchange::kucoin::Credentials credentials;
    bool sandbox = false;
};

struct TradingSettings {
    bool enabled = true;  // false = watch only
    std::string symbol = "SOLUSDTM";
    int leverage = 5;
    double position_size = 1.0;
};

struct StrategySettings {
    double rsi_lower = 40.0;
    double rsi_upper = 60.0;
    int64_t signal_buffer_seconds = 3;
    size_t max_history = 100;
    bool require_confluence = false;
};

struct FeedSettings {
    int64_t ping_interval_seconds = 20;
    int64_t reconnect_initial_seconds = 5;
    int64_t reconnect_max_seconds = 60;
    int64_t stable_connection_seconds = 30;
    int64_t request_timeout_seconds = 10;
};

struct AppConfig {
    ExchangeSettings exchange;
    TradingSettings trading;
    StrategySettings strategy;
    FeedSettings feed;
    utils::LogConfig logging;
    app::DisplayConfig display;

    /// Throws ConfigError on the first problem found
    void validate() const;
};

/// Returns the variable's value, std::nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

/// std::getenv-backed lookup; empty values count as unset
[[nodiscard]] std::optional<std::string> system_env(const char* name);

/// Load `path`; defaults when the file does not exist. Throws ConfigError.
[[nodiscard]] AppConfig load_config(const std::string& path);

/// Same parsing from an in-memory document. Throws ConfigError.
[[nodiscard]] AppConfig load_config_from_string(const std::string& yaml);

/// Apply the environment overrides. Throws ConfigError on unparsable numbers.
void apply_env_overrides(AppConfig& config, const EnvLookup& lookup = system_env);

}  // namespace pulse::config
