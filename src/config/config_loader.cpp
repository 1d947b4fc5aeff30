#include "config/config_loader.hpp"
#include "security/trusted_proxy_list.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <string_view>

using namespace std::string_literals;

namespace gatekeeper {

namespace {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_node(val);
    }
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_node(elem);
        }
    }
}

// ---- Extraction helpers ----------------------------------------------------

/// Replace out with the string array at key; leaves out untouched if key is absent
void assign_string_array(const toml::table& tbl, std::string_view key,
                         std::vector<std::string>& out) {
    const auto* arr = tbl[key].as_array();
    if (!arr) return;
    out.clear();
    out.reserve(arr->size());
    for (const auto& elem : *arr) {
        if (const auto* s = elem.as_string()) {
            out.emplace_back(s->get());
        }
    }
}

constexpr int64_t kMaxHstsMaxAge = 0xFFFFFFFF;

struct CspKey {
    std::string_view toml_key;
    std::vector<std::string> CspConfig::* sources;
};

constexpr CspKey kCspKeys[] = {
    {"default_src", &CspConfig::default_src},
    {"script_src",  &CspConfig::script_src},
    {"style_src",   &CspConfig::style_src},
    {"font_src",    &CspConfig::font_src},
    {"img_src",     &CspConfig::img_src},
    {"connect_src", &CspConfig::connect_src},
    {"frame_src",   &CspConfig::frame_src},
    {"object_src",  &CspConfig::object_src},
    {"base_uri",    &CspConfig::base_uri},
    {"form_action", &CspConfig::form_action},
};

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = s["port"].value_or(8080);
    // Negative counts map to 0 so validate_config rejects them
    const auto threads = s["threads"].value_or(int64_t{4});
    cfg.thread_pool_size = threads > 0 ? static_cast<size_t>(threads) : 0;
    assign_string_array(s, "trusted_proxies", cfg.trusted_proxies);

    if (const auto* tls = s["tls"].as_table()) {
        cfg.tls.enabled = (*tls)["enabled"].value_or(false);
        cfg.tls.cert_file = (*tls)["cert_file"].value_or(""s);
        cfg.tls.key_file = (*tls)["key_file"].value_or(""s);
        cfg.tls.ca_file = (*tls)["ca_file"].value_or(""s);
        cfg.tls.require_client_cert = (*tls)["require_client_cert"].value_or(false);
    }
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or("info"s);
    }
    return cfg;
}

CorsConfig extract_cors(const toml::table& root) {
    CorsConfig cfg;
    const auto* cors = root["cors"].as_table();
    if (!cors) return cfg;
    const auto& c = *cors;

    assign_string_array(c, "allowed_origins", cfg.allowed_origins);
    cfg.allow_credentials = c["allow_credentials"].value_or(true);
    assign_string_array(c, "allow_methods", cfg.allow_methods);
    assign_string_array(c, "allow_headers", cfg.allow_headers);
    cfg.max_age_seconds = c["max_age_seconds"].value_or(int64_t{86400});
    cfg.preflight_status = c["preflight_status"].value_or(200);
    return cfg;
}

HeaderPolicyConfig extract_headers(const toml::table& root) {
    HeaderPolicyConfig cfg;
    const auto* headers = root["headers"].as_table();
    if (!headers) return cfg;
    const auto& h = *headers;

    cfg.hsts_max_age = h["hsts_max_age"].value_or(int64_t{31536000});
    cfg.hsts_include_subdomains = h["hsts_include_subdomains"].value_or(true);

    if (const auto* csp = h["csp"].as_table()) {
        for (const auto& key : kCspKeys) {
            assign_string_array(*csp, key.toml_key, cfg.csp.*key.sources);
        }
    }
    return cfg;
}

GatekeeperConfig extract_all_sections(const toml::table& tbl) {
    GatekeeperConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.security.cors = extract_cors(tbl);
    config.security.headers = extract_headers(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatekeeperConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatekeeperConfig& config) {
    std::vector<std::string> errors;

    const auto& server = config.server;
    if (server.port < 1 || server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", server.port));
    }
    if (server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }
    if (server.tls.enabled) {
        if (server.tls.cert_file.empty()) {
            errors.push_back("server.tls.cert_file required when TLS is enabled");
        }
        if (server.tls.key_file.empty()) {
            errors.push_back("server.tls.key_file required when TLS is enabled");
        }
        if (server.tls.require_client_cert && server.tls.ca_file.empty()) {
            errors.push_back("server.tls.ca_file required when require_client_cert is true");
        }
    }
    for (const auto& proxy : server.trusted_proxies) {
        TrustedProxyList::CidrRange range;
        if (!TrustedProxyList::parse_cidr(proxy, range)) {
            errors.push_back(std::format("server.trusted_proxies entry '{}' is not an IPv4 address or CIDR", proxy));
        }
    }

    const auto level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" &&
        level != "warning" && level != "error") {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
                                     config.logging.level));
    }

    const auto& cors = config.security.cors;
    for (size_t i = 0; i < cors.allowed_origins.size(); ++i) {
        const auto& origin = cors.allowed_origins[i];
        if (origin.empty()) {
            errors.push_back(std::format("cors.allowed_origins[{}] must not be empty", i));
        } else if (origin == "*") {
            errors.push_back("cors.allowed_origins must list origins explicitly, '*' is not allowed");
        } else if (origin.ends_with("*.")) {
            errors.push_back(std::format("cors.allowed_origins[{}] wildcard '{}' has no domain", i, origin));
        }
    }
    if (cors.allow_methods.empty()) {
        errors.push_back("cors.allow_methods must not be empty");
    }
    if (cors.allow_headers.empty()) {
        errors.push_back("cors.allow_headers must not be empty");
    }
    if (cors.max_age_seconds < 0) {
        errors.push_back(std::format("cors.max_age_seconds must be >= 0, got {}", cors.max_age_seconds));
    }
    if (cors.preflight_status < 200 || cors.preflight_status > 299) {
        errors.push_back(std::format("cors.preflight_status must be 2xx, got {}", cors.preflight_status));
    }

    const auto& headers = config.security.headers;
    if (headers.hsts_max_age <= 0 || headers.hsts_max_age > kMaxHstsMaxAge) {
        errors.push_back(std::format("headers.hsts_max_age must be 1-{}, got {}",
                                     kMaxHstsMaxAge, headers.hsts_max_age));
    }
    if (headers.csp.default_src.empty()) {
        errors.push_back("headers.csp.default_src must not be empty");
    }
    for (const auto& key : kCspKeys) {
        for (const auto& source : headers.csp.*key.sources) {
            if (source == "*") {
                errors.push_back(std::format(
                    "headers.csp.{} must enumerate sources, '*' is not allowed", key.toml_key));
            }
        }
    }

    return errors;
}

} // namespace gatekeeper
