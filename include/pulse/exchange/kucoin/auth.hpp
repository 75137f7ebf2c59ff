#pragma once
// ============================================================================
// PULSE TRADE BOT - KuCoin Authentication
// ============================================================================
// API v2 request signing:
//   KC-API-SIGN       = base64(HMAC-SHA256(secret, ts + method + endpoint + body))
//   KC-API-PASSPHRASE = base64(HMAC-SHA256(secret, passphrase))
// `endpoint` is the request target including the query string.
// ============================================================================

#include "pulse/network/rest_client.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace pulse::exchange::kucoin {

struct Credentials {
    std::string api_key;
    std::string api_secret;
    std::string api_passphrase;

    [[nodiscard]] bool complete() const noexcept {
        return !api_key.empty() && !api_secret.empty() && !api_passphrase.empty();
    }
};

/// base64(HMAC-SHA256(key, data))
[[nodiscard]] std::string hmac_sha256_base64(std::string_view key, std::string_view data);

/// Adds the KC-API-* headers to `request` for the given millisecond timestamp
void sign_request(network::HttpRequest& request, const Credentials& credentials, int64_t timestamp_ms);

}  // namespace pulse::exchange::kucoin
