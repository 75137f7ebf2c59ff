#pragma once
// ============================================================================
// PULSE TRADE BOT - Error Types
// ============================================================================
// Exception hierarchy used across the feed, REST and execution layers.
// Everything except ConfigError is recoverable at the pipeline level.
// ============================================================================

#include <stdexcept>
#include <string>
#include <utility>

namespace pulse {

/// Base for all bot errors
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Socket / DNS / TLS / timeout failures. Retried with backoff.
class TransportError : public Error {
public:
    using Error::Error;
};

/// Token or request rejected by the exchange as unauthorized.
class AuthError : public Error {
public:
    using Error::Error;
};

/// Frame could not be decoded into a MarketEvent. The frame is dropped.
class MalformedEventError : public Error {
public:
    using Error::Error;
};

/// Exchange rejected an order, leverage change or position close.
class OrderExecutionError : public Error {
public:
    OrderExecutionError(std::string message, std::string code = {}, bool no_position = false)
        : Error(std::move(message)), code_(std::move(code)), no_position_(no_position) {}

    /// Exchange error code from the response envelope (may be empty)
    [[nodiscard]] const std::string& code() const noexcept { return code_; }

    /// True when the call failed only because there was no position to act on
    [[nodiscard]] bool no_position() const noexcept { return no_position_; }

private:
    std::string code_;
    bool no_position_;
};

/// Invalid startup configuration. The only fatal error.
class ConfigError : public Error {
public:
    using Error::Error;
};

}  // namespace pulse
