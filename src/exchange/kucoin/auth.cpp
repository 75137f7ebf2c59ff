// ============================================================================
// PULSE TRADE BOT - KuCoin Authentication
// ============================================================================

#include "pulse/exchange/kucoin/auth.hpp"
#include "pulse/core/errors.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <vector>

namespace pulse::exchange::kucoin {

std::string hmac_sha256_base64(std::string_view key, std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    const unsigned char* result = HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         digest, &digest_len);
    if (result == nullptr) {
        throw AuthError("HMAC-SHA256 failed");
    }

    // 4 output chars per 3 input bytes, plus the terminator EVP_EncodeBlock writes
    std::vector<unsigned char> encoded(4 * ((digest_len + 2) / 3) + 1);
    const int length = EVP_EncodeBlock(encoded.data(), digest, static_cast<int>(digest_len));
    return std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(length));
}

void sign_request(network::HttpRequest& request, const Credentials& credentials, int64_t timestamp_ms) {
    const std::string timestamp = std::to_string(timestamp_ms);

    std::string payload = timestamp;
    payload += network::to_string(request.method);
    payload += network::build_target(request);
    payload += request.body;

    request.headers["KC-API-KEY"] = credentials.api_key;
    request.headers["KC-API-SIGN"] = hmac_sha256_base64(credentials.api_secret, payload);
    request.headers["KC-API-TIMESTAMP"] = timestamp;
    request.headers["KC-API-PASSPHRASE"] =
        hmac_sha256_base64(credentials.api_secret, credentials.api_passphrase);
    request.headers["KC-API-KEY-VERSION"] = "2";
}

}  // namespace pulse::exchange::kucoin
