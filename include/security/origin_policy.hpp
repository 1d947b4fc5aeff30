#pragma once

#include "config/config_types.hpp"

#include <optional>
#include <string_view>

namespace gatekeeper {

/**
 * @brief Cross-origin allow decision
 *
 * Allow-list entries are either exact origins ("https://app.example.com")
 * or suffix wildcards:
 *   "*.example.com"          any scheme, host example.com or any subdomain
 *   "https://*.example.com"  same, scheme must be https
 *
 * A wildcard only matches on a label boundary: "*.example.com" accepts
 * "https://api.example.com" and "https://example.com" but never
 * "https://notexample.com". An origin carrying a port only matches
 * exact entries or wildcards whose domain includes that port.
 */
class OriginPolicy {
public:
    explicit OriginPolicy(OriginAllowList allow_list);

    [[nodiscard]] bool is_allowed(std::optional<std::string_view> origin) const;

    [[nodiscard]] const OriginAllowList& allow_list() const noexcept { return allow_list_; }

    /**
     * @brief Check an origin against an allow-list
     * @return false for absent/empty origin; exact entries are checked
     *         before wildcard entries, any wildcard match suffices
     */
    [[nodiscard]] static bool is_allowed(std::optional<std::string_view> origin,
                                         const OriginAllowList& allow_list);

    /// True if pattern is a wildcard entry and origin falls under it
    [[nodiscard]] static bool matches_wildcard(std::string_view origin,
                                               std::string_view pattern);

    [[nodiscard]] static bool is_wildcard(std::string_view pattern);

private:
    const OriginAllowList allow_list_;
};

} // namespace gatekeeper
