#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "server/cors_responder.hpp"
#include "server/security_headers.hpp"

#include <optional>
#include <string>

namespace gatekeeper {

/**
 * @brief Request pipeline between the listener and application handlers
 *
 *   CorsResponder (may short-circuit preflight)
 *     -> application handler
 *     -> SecurityHeaderInjector (every response, preflights included)
 *
 * Immutable after construction; safe to share across request threads.
 */
class SecurityGateway {
public:
    explicit SecurityGateway(const SecurityPolicyConfig& config);

    /// Run the whole pipeline around handler
    [[nodiscard]] GatewayResponse process(const RequestContext& ctx, const Handler& handler) const;

    /**
     * @brief Preflight short-circuit for adapters with their own router
     * @return The finished preflight response, or nullopt if the request
     *         must be routed to the application
     */
    [[nodiscard]] std::optional<GatewayResponse> intercept(const RequestContext& ctx) const;

    /// Outbound step: CORS headers, security headers, X-Request-ID. Idempotent.
    void finalize(const RequestContext& ctx, GatewayResponse& response) const;

    /// Bucket key for the host's rate-limit counter
    [[nodiscard]] std::string rate_limit_key(const RequestContext& ctx) const;

    [[nodiscard]] const SecurityHeaderInjector& headers() const noexcept { return headers_; }

private:
    void finish_outbound(const RequestContext& ctx, GatewayResponse& response) const;

    const CorsResponder cors_;
    const SecurityHeaderInjector headers_;
};

} // namespace gatekeeper
