// ============================================================================
// PULSE TRADE BOT - Logger Implementation
// ============================================================================

#include "pulse/utils/logger.hpp"
#include "pulse/core/errors.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace pulse::utils {

LogLevel parse_log_level(std::string_view name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    throw ConfigError("unknown log level: " + std::string(name));
}

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_logger(const LogConfig& config, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, config.max_file_size_mb * 1024 * 1024, config.max_files,
            config.rotate_on_open));
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        // One background thread shared by every async logger in the process
        static std::once_flag pool_once;
        std::call_once(pool_once, [&config] {
            spdlog::init_thread_pool(config.queue_size, 1);
        });
        logger = std::make_shared<spdlog::async_logger>(
            name, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    } else {
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(config.flush_level);
    return logger;
}

std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name) {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

}  // namespace pulse::utils
