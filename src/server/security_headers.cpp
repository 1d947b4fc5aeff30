#include "server/security_headers.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <format>
#include <iterator>

namespace gatekeeper {

namespace {

struct CspDirective {
    std::string_view name;
    std::vector<std::string> CspConfig::* sources;
};

constexpr CspDirective kCspDirectives[] = {
    {"default-src", &CspConfig::default_src},
    {"script-src",  &CspConfig::script_src},
    {"style-src",   &CspConfig::style_src},
    {"font-src",    &CspConfig::font_src},
    {"img-src",     &CspConfig::img_src},
    {"connect-src", &CspConfig::connect_src},
    {"frame-src",   &CspConfig::frame_src},
    {"object-src",  &CspConfig::object_src},
    {"base-uri",    &CspConfig::base_uri},
    {"form-action", &CspConfig::form_action},
};

} // anonymous namespace

std::string SecurityHeaderInjector::compose_csp(const CspConfig& csp) {
    std::vector<std::string> clauses;
    clauses.reserve(std::size(kCspDirectives));
    for (const auto& directive : kCspDirectives) {
        const auto& sources = csp.*directive.sources;
        if (sources.empty()) continue;
        clauses.emplace_back(std::format("{} {}", directive.name, utils::join(sources, " ")));
    }
    return utils::join(clauses, "; ");
}

std::string SecurityHeaderInjector::compose_hsts(int64_t max_age, bool include_subdomains) {
    std::string value = std::format("max-age={}", max_age);
    if (include_subdomains) {
        value += "; includeSubDomains";
    }
    return value;
}

SecurityHeaderInjector::SecurityHeaderInjector(const HeaderPolicyConfig& config)
    : csp_(compose_csp(config.csp)),
      hsts_(compose_hsts(config.hsts_max_age, config.hsts_include_subdomains)) {
    always_ = {
        {http::kContentTypeOptions, "nosniff"},
        {http::kFrameOptions, "DENY"},
        {http::kXssProtection, "1; mode=block"},
        {http::kReferrerPolicy, "strict-origin-when-cross-origin"},
        {http::kPermissionsPolicy, "geolocation=(), microphone=(), camera=()"},
        {http::kContentSecurityPolicy, csp_},
    };
}

void SecurityHeaderInjector::apply(const RequestContext& ctx, GatewayResponse& response) const {
    for (const auto& [name, value] : always_) {
        response.set_header(name, value);
    }
    if (ctx.scheme == Scheme::HTTPS) {
        response.set_header(http::kStrictTransportSecurity, hsts_);
    }
}

} // namespace gatekeeper
