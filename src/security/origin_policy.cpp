#include "security/origin_policy.hpp"

#include <algorithm>
#include <utility>

namespace gatekeeper {

namespace {

constexpr std::string_view kWildcardPrefix = "*.";
constexpr std::string_view kSchemeSeparator = "://";

struct OriginParts {
    std::string_view scheme;     // empty when no "://"
    std::string_view authority;  // host[:port]
};

OriginParts split_origin(std::string_view s) {
    const auto sep = s.find(kSchemeSeparator);
    if (sep == std::string_view::npos) {
        return {{}, s};
    }
    return {s.substr(0, sep), s.substr(sep + kSchemeSeparator.size())};
}

/// authority == domain, or authority ends with "." + domain
bool authority_within(std::string_view authority, std::string_view domain) {
    if (domain.empty()) return false;
    if (authority == domain) return true;
    return authority.size() > domain.size() &&
           authority.ends_with(domain) &&
           authority[authority.size() - domain.size() - 1] == '.';
}

} // anonymous namespace

OriginPolicy::OriginPolicy(OriginAllowList allow_list)
    : allow_list_(std::move(allow_list)) {}

bool OriginPolicy::is_allowed(std::optional<std::string_view> origin) const {
    return is_allowed(origin, allow_list_);
}

bool OriginPolicy::is_wildcard(std::string_view pattern) {
    return split_origin(pattern).authority.starts_with(kWildcardPrefix);
}

bool OriginPolicy::matches_wildcard(std::string_view origin, std::string_view pattern) {
    const auto pat = split_origin(pattern);
    if (!pat.authority.starts_with(kWildcardPrefix)) return false;

    const auto org = split_origin(origin);
    if (!pat.scheme.empty() && pat.scheme != org.scheme) return false;

    return authority_within(org.authority, pat.authority.substr(kWildcardPrefix.size()));
}

bool OriginPolicy::is_allowed(std::optional<std::string_view> origin,
                              const OriginAllowList& allow_list) {
    if (!origin || origin->empty()) return false;

    const auto exact = std::find(allow_list.begin(), allow_list.end(), *origin);
    if (exact != allow_list.end()) return true;

    return std::any_of(allow_list.begin(), allow_list.end(),
        [&origin](const std::string& pattern) {
            return matches_wildcard(*origin, pattern);
        });
}

} // namespace gatekeeper
