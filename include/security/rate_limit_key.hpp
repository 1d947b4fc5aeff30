#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace gatekeeper {

/**
 * @brief Derives the rate-limit bucket key for a request
 *
 * key = hex(MD5(client_address + ":" + client_identity)), with "unknown"
 * substituted for an absent component. Deterministic across processes
 * (no salt). This is a bucketing key, not a credential: collisions only
 * merge two clients into one bucket.
 */
class RateLimitKeyDeriver {
public:
    static constexpr std::string_view kUnknown = "unknown";
    static constexpr size_t kKeyLength = 32;  // 128-bit digest as hex

    /// @throws std::runtime_error if the crypto provider has no MD5
    [[nodiscard]] static std::string derive_key(std::optional<std::string_view> client_address,
                                                std::optional<std::string_view> client_identity);

    [[nodiscard]] static std::string derive_key(const RequestContext& ctx);
};

} // namespace gatekeeper
