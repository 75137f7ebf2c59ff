#pragma once
// ============================================================================
// PULSE TRADE BOT - Logger
// ============================================================================
// spdlog factory. There is no global logger: main builds one and hands a
// shared_ptr to every component that logs.
// ============================================================================

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace pulse::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Parse "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off".
/// Throws ConfigError on anything else.
[[nodiscard]] LogLevel parse_log_level(std::string_view name);

[[nodiscard]] spdlog::level::level_enum to_spdlog(LogLevel level) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file = "pulse_trade_bot.log";  // empty = console only
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
    bool console = true;

    // Performance settings
    bool async = true;
    size_t queue_size = 8192;
    spdlog::level::level_enum flush_level = spdlog::level::warn;

    // File settings
    size_t max_file_size_mb = 100;
    size_t max_files = 10;
    bool rotate_on_open = false;
};

/// Build a logger with a colour console sink and a rotating file sink.
/// Throws spdlog::spdlog_ex if the log file cannot be opened.
[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger(const LogConfig& config,
                                                          const std::string& name = "pulse");

/// Logger that discards everything (tests, tools)
[[nodiscard]] std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name = "null");

// ============================================================================
// Scoped Timer for Performance Measurement
// ============================================================================

class ScopedTimer {
public:
    ScopedTimer(spdlog::logger& logger, std::string_view name, LogLevel level = LogLevel::Debug)
        : logger_(logger), name_(name), level_(level),
          start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto duration =
            std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        logger_.log(to_spdlog(level_), "{} took {} us", name_, duration);
    }

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    spdlog::logger& logger_;
    std::string_view name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace pulse::utils
