#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "security/origin_policy.hpp"

#include <string>
#include <string_view>

namespace gatekeeper {

enum class CorsRequestKind {
    PREFLIGHT,  // OPTIONS: answered here, never reaches the application
    NORMAL      // Any other method: application handler runs first
};

/**
 * @brief Cross-origin request handling
 *
 * Both request kinds end in the same header step:
 * - Allowed origin: Access-Control-Allow-Origin echoes the request origin
 *   (never "*", so credentialed requests keep working) and, when enabled,
 *   Access-Control-Allow-Credentials: true
 * - Always: Access-Control-Allow-Methods, Access-Control-Allow-Headers,
 *   Access-Control-Max-Age, Vary: Origin
 */
class CorsResponder {
public:
    explicit CorsResponder(const CorsConfig& config);

    [[nodiscard]] static CorsRequestKind classify(std::string_view method) noexcept;

    /// Short-circuit preflight or run next, then apply CORS headers
    [[nodiscard]] GatewayResponse handle(const RequestContext& ctx, const Handler& next) const;

    /// Empty-bodied preflight answer with the full CORS header set
    [[nodiscard]] GatewayResponse preflight(const RequestContext& ctx) const;

    /// Idempotent
    void apply_headers(const RequestContext& ctx, GatewayResponse& response) const;

private:
    const OriginPolicy origin_policy_;
    const bool allow_credentials_;
    const std::string allow_methods_;
    const std::string allow_headers_;
    const std::string max_age_;
    const int preflight_status_;
};

} // namespace gatekeeper
