#pragma once

#include <string>

namespace riskgov {
namespace exchange {

/**
 * HMAC-SHA256 request signing for the live exchange.
 *
 * Signature = hex(HMAC_SHA256(secret, nonce + user_id + api_key)).
 */
class RequestSigner {
public:
    RequestSigner(std::string api_key, std::string api_secret, std::string user_id);

    std::string sign(const std::string& nonce) const;

    // Lowercase hex HMAC-SHA256 of payload under key
    static std::string hmac_sha256_hex(const std::string& key, const std::string& payload);

    const std::string& api_key() const { return api_key_; }
    const std::string& user_id() const { return user_id_; }

private:
    std::string api_key_;
    std::string api_secret_;
    std::string user_id_;
};

} // namespace exchange
} // namespace riskgov
