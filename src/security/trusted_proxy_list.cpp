#include "security/trusted_proxy_list.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace gatekeeper {

TrustedProxyList::TrustedProxyList(const std::vector<std::string>& entries) {
    ranges_.reserve(entries.size());
    for (const auto& entry : entries) {
        CidrRange range;
        if (parse_cidr(entry, range)) {
            ranges_.push_back(range);
        } else {
            utils::log::warn(std::format("Ignoring invalid trusted proxy entry '{}'", entry));
        }
    }
}

bool TrustedProxyList::parse_ip(std::string_view ip, uint32_t& out) {
    uint32_t octets[4]{};
    size_t octet_idx = 0;
    uint32_t val = 0;
    size_t digits = 0;

    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i == ip.size() || ip[i] == '.') {
            if (digits == 0 || val > 255 || octet_idx > 3) return false;
            octets[octet_idx++] = val;
            val = 0;
            digits = 0;
        } else if (ip[i] >= '0' && ip[i] <= '9') {
            if (++digits > 3) return false;
            val = val * 10 + static_cast<uint32_t>(ip[i] - '0');
        } else {
            return false;
        }
    }
    if (octet_idx != 4) return false;
    out = (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
    return true;
}

bool TrustedProxyList::parse_cidr(std::string_view cidr, CidrRange& out) {
    const auto slash = cidr.find('/');
    if (slash == std::string_view::npos) {
        if (!parse_ip(cidr, out.network)) return false;
        out.mask = 0xFFFFFFFFu;
        return true;
    }

    if (!parse_ip(cidr.substr(0, slash), out.network)) return false;

    const auto prefix_str = cidr.substr(slash + 1);
    if (prefix_str.empty() || prefix_str.size() > 2) return false;
    uint32_t prefix = 0;
    for (const char c : prefix_str) {
        if (c < '0' || c > '9') return false;
        prefix = prefix * 10 + static_cast<uint32_t>(c - '0');
    }
    if (prefix > 32) return false;
    out.mask = (prefix == 0) ? 0u : ~((1u << (32 - prefix)) - 1);
    out.network &= out.mask;
    return true;
}

std::string_view TrustedProxyList::strip_ipv6_mapped(std::string_view addr) {
    constexpr std::string_view prefix = "::ffff:";
    if (addr.size() > prefix.size() && addr.starts_with(prefix)) {
        return addr.substr(prefix.size());
    }
    return addr;
}

bool TrustedProxyList::contains(std::string_view peer) const {
    if (ranges_.empty()) return false;

    uint32_t ip = 0;
    if (!parse_ip(strip_ipv6_mapped(peer), ip)) return false;

    return std::any_of(ranges_.begin(), ranges_.end(), [ip](const CidrRange& r) {
        return (ip & r.mask) == r.network;
    });
}

} // namespace gatekeeper
