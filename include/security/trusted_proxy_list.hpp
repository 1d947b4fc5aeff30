#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gatekeeper {

/**
 * @brief Peers allowed to speak for the client via X-Forwarded-* headers
 *
 * Entries are IPv4 addresses or CIDR ranges ("10.0.0.0/8"). Parsed once at
 * construction; an empty list trusts nobody.
 */
class TrustedProxyList {
public:
    struct CidrRange {
        uint32_t network = 0;
        uint32_t mask = 0;
    };

    TrustedProxyList() = default;
    explicit TrustedProxyList(const std::vector<std::string>& entries);

    /// @param peer Transport peer address (IPv6-mapped IPv4 accepted)
    [[nodiscard]] bool contains(std::string_view peer) const;

    [[nodiscard]] bool empty() const noexcept { return ranges_.empty(); }

    static bool parse_ip(std::string_view ip, uint32_t& out);
    static bool parse_cidr(std::string_view cidr, CidrRange& out);

    /// "::ffff:172.18.0.4" -> "172.18.0.4"; anything else unchanged
    [[nodiscard]] static std::string_view strip_ipv6_mapped(std::string_view addr);

private:
    std::vector<CidrRange> ranges_;
};

} // namespace gatekeeper
