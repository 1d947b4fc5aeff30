#include "server/cors_responder.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <format>

namespace gatekeeper {

namespace {

bool lists_token(std::string_view list, std::string_view token) {
    const auto wanted = utils::to_lower(token);
    size_t start = 0;
    while (start <= list.size()) {
        const auto comma = list.find(',', start);
        const auto end = (comma == std::string_view::npos) ? list.size() : comma;
        if (utils::to_lower(utils::trim(list.substr(start, end - start))) == wanted) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

// Add token to the Vary list unless already present
void append_vary(GatewayResponse& response, std::string_view token) {
    const auto it = response.headers.find(http::kVary);
    if (it == response.headers.end()) {
        response.set_header(http::kVary, token);
        return;
    }
    if (lists_token(it->second, token)) return;
    it->second += ", ";
    it->second += token;
}

} // anonymous namespace

CorsResponder::CorsResponder(const CorsConfig& config)
    : origin_policy_(config.allowed_origins),
      allow_credentials_(config.allow_credentials),
      allow_methods_(utils::join(config.allow_methods, ", ")),
      allow_headers_(utils::join(config.allow_headers, ", ")),
      max_age_(std::to_string(config.max_age_seconds)),
      preflight_status_(config.preflight_status) {}

CorsRequestKind CorsResponder::classify(std::string_view method) noexcept {
    return method == http::kPreflightMethod ? CorsRequestKind::PREFLIGHT
                                            : CorsRequestKind::NORMAL;
}

GatewayResponse CorsResponder::handle(const RequestContext& ctx, const Handler& next) const {
    switch (classify(ctx.method)) {
        case CorsRequestKind::PREFLIGHT:
            return preflight(ctx);
        case CorsRequestKind::NORMAL:
            break;
    }
    GatewayResponse response = next(ctx);
    apply_headers(ctx, response);
    return response;
}

GatewayResponse CorsResponder::preflight(const RequestContext& ctx) const {
    GatewayResponse response;
    response.status = preflight_status_;
    apply_headers(ctx, response);
    return response;
}

void CorsResponder::apply_headers(const RequestContext& ctx, GatewayResponse& response) const {
    if (origin_policy_.is_allowed(ctx.origin)) {
        response.set_header(http::kAllowOrigin, *ctx.origin);
        if (allow_credentials_) {
            response.set_header(http::kAllowCredentials, "true");
        }
    } else if (ctx.origin && !ctx.origin->empty()) {
        utils::log::debug(std::format("CORS origin not allowed: {}", *ctx.origin));
    }

    response.set_header(http::kAllowMethods, allow_methods_);
    response.set_header(http::kAllowHeaders, allow_headers_);
    response.set_header(http::kMaxAge, max_age_);
    append_vary(response, http::kOriginHeader);
}

} // namespace gatekeeper
