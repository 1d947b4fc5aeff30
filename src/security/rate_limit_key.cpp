#include "security/rate_limit_key.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace gatekeeper {

std::string RateLimitKeyDeriver::derive_key(std::optional<std::string_view> client_address,
                                            std::optional<std::string_view> client_identity) {
    std::string material;
    const auto address = client_address.value_or(kUnknown);
    const auto identity = client_identity.value_or(kUnknown);
    material.reserve(address.size() + 1 + identity.size());
    material += address;
    material += ':';
    material += identity;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(material.data(), material.size(),
                   digest, &digest_len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest unavailable for rate limit key");
    }
    return utils::bytes_to_hex(digest, digest_len);
}

std::string RateLimitKeyDeriver::derive_key(const RequestContext& ctx) {
    std::optional<std::string_view> address;
    std::optional<std::string_view> identity;
    if (ctx.client_address) address = *ctx.client_address;
    if (ctx.client_identity) identity = *ctx.client_identity;
    return derive_key(address, identity);
}

} // namespace gatekeeper
