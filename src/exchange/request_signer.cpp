#include "../../include/riskgov/exchange/request_signer.hpp"

#include <iomanip>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace riskgov::exchange {

RequestSigner::RequestSigner(std::string api_key, std::string api_secret, std::string user_id)
    : api_key_(std::move(api_key))
    , api_secret_(std::move(api_secret))
    , user_id_(std::move(user_id)) {}

std::string RequestSigner::sign(const std::string& nonce) const {
    return hmac_sha256_hex(api_secret_, nonce + user_id_ + api_key_);
}

std::string RequestSigner::hmac_sha256_hex(const std::string& key, const std::string& payload) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    unsigned char* result =
        HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(payload.data()), payload.size(), digest, &digest_len);
    if (!result) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i)
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return out.str();
}

} // namespace riskgov::exchange
