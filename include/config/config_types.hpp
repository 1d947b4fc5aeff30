#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gatekeeper {

// ============================================================================
// Configuration Types
// ============================================================================

struct TlsConfig {
    bool enabled = false;
    std::string cert_file;            // Server certificate (PEM)
    std::string key_file;             // Server private key (PEM)
    std::string ca_file;              // CA cert for client verification (mTLS)
    bool require_client_cert = false; // mTLS mode
};

struct ServerConfig {
    std::string host;
    int port;
    size_t thread_pool_size;
    std::vector<std::string> trusted_proxies;  // IPs/CIDRs allowed to set X-Forwarded-*
    TlsConfig tls;

    ServerConfig()
        : host("0.0.0.0"),
          port(8080),
          thread_pool_size(4) {}
};

struct LoggingConfig {
    std::string level = "info";
};

/// Ordered allowed-origin patterns: exact origins, "*.domain" or "scheme://*.domain"
using OriginAllowList = std::vector<std::string>;

struct CorsConfig {
    OriginAllowList allowed_origins = {
        "http://localhost:3000",
        "http://localhost:8000",
        "https://*.vercel.app",
    };
    bool allow_credentials = true;
    std::vector<std::string> allow_methods = {
        "GET", "POST", "PUT", "DELETE", "OPTIONS", "PATCH",
    };
    std::vector<std::string> allow_headers = {
        "Accept", "Accept-Language", "Content-Language", "Content-Type",
        "Authorization", "X-Requested-With", "X-User-Email",
    };
    int64_t max_age_seconds = 86400;
    int preflight_status = 200;
};

/**
 * @brief Source list per Content-Security-Policy directive
 *
 * An empty list omits the directive from the composed header.
 */
struct CspConfig {
    std::vector<std::string> default_src = {"'self'"};
    std::vector<std::string> script_src = {
        "'self'", "'unsafe-inline'", "'unsafe-eval'",
        "https://js.stripe.com", "https://clerk.com",
    };
    std::vector<std::string> style_src = {
        "'self'", "'unsafe-inline'", "https://fonts.googleapis.com",
    };
    std::vector<std::string> font_src = {"'self'", "https://fonts.gstatic.com"};
    std::vector<std::string> img_src = {"'self'", "data:", "https:"};
    std::vector<std::string> connect_src = {
        "'self'", "https://api.stripe.com", "https://clerk.com", "https://*.clerk.com",
    };
    std::vector<std::string> frame_src = {
        "'self'", "https://js.stripe.com", "https://clerk.com",
    };
    std::vector<std::string> object_src = {"'none'"};
    std::vector<std::string> base_uri = {"'self'"};
    std::vector<std::string> form_action = {"'self'"};
};

struct HeaderPolicyConfig {
    CspConfig csp;
    int64_t hsts_max_age = 31536000;  // 1 year
    bool hsts_include_subdomains = true;
};

/**
 * @brief Static values injected into every response
 *
 * Loaded once at startup and passed into each component's constructor.
 */
struct SecurityPolicyConfig {
    CorsConfig cors;
    HeaderPolicyConfig headers;
};

struct GatekeeperConfig {
    ServerConfig server;
    LoggingConfig logging;
    SecurityPolicyConfig security;
};

} // namespace gatekeeper
