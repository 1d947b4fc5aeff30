#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace gatekeeper {

/**
 * @brief Writes the hardened response header set
 *
 * Header values are composed once at construction and copied onto every
 * response. Always sets X-Content-Type-Options, X-Frame-Options,
 * X-XSS-Protection, Referrer-Policy, Permissions-Policy and
 * Content-Security-Policy; adds Strict-Transport-Security only for https
 * requests. Existing values of those headers are overwritten.
 */
class SecurityHeaderInjector {
public:
    explicit SecurityHeaderInjector(const HeaderPolicyConfig& config);

    void apply(const RequestContext& ctx, GatewayResponse& response) const;

    [[nodiscard]] const std::string& content_security_policy() const noexcept { return csp_; }
    [[nodiscard]] const std::string& strict_transport_security() const noexcept { return hsts_; }

    /**
     * @brief Join "directive sources..." clauses with "; "
     *
     * Fixed order: default-src, script-src, style-src, font-src, img-src,
     * connect-src, frame-src, object-src, base-uri, form-action.
     * Directives with an empty source list are omitted.
     */
    [[nodiscard]] static std::string compose_csp(const CspConfig& csp);

    [[nodiscard]] static std::string compose_hsts(int64_t max_age, bool include_subdomains);

private:
    using HeaderPair = std::pair<std::string_view, std::string>;

    std::string csp_;
    std::string hsts_;
    std::vector<HeaderPair> always_;
};

} // namespace gatekeeper
