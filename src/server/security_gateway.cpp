#include "server/security_gateway.hpp"
#include "server/http_constants.hpp"
#include "security/rate_limit_key.hpp"

namespace gatekeeper {

SecurityGateway::SecurityGateway(const SecurityPolicyConfig& config)
    : cors_(config.cors),
      headers_(config.headers) {}

GatewayResponse SecurityGateway::process(const RequestContext& ctx, const Handler& handler) const {
    GatewayResponse response = cors_.handle(ctx, handler);
    finish_outbound(ctx, response);
    return response;
}

std::optional<GatewayResponse> SecurityGateway::intercept(const RequestContext& ctx) const {
    if (CorsResponder::classify(ctx.method) != CorsRequestKind::PREFLIGHT) {
        return std::nullopt;
    }
    GatewayResponse response = cors_.preflight(ctx);
    finish_outbound(ctx, response);
    return response;
}

void SecurityGateway::finalize(const RequestContext& ctx, GatewayResponse& response) const {
    cors_.apply_headers(ctx, response);
    finish_outbound(ctx, response);
}

std::string SecurityGateway::rate_limit_key(const RequestContext& ctx) const {
    return RateLimitKeyDeriver::derive_key(ctx);
}

void SecurityGateway::finish_outbound(const RequestContext& ctx, GatewayResponse& response) const {
    headers_.apply(ctx, response);
    if (!ctx.request_id.empty()) {
        response.set_header(http::kRequestIdHeader, ctx.request_id);
    }
}

} // namespace gatekeeper
