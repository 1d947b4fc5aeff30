#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/security_gateway.hpp"
#include "server/field_validation_handler.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings.
// CPPHTTPLIB_OPENSSL_SUPPORT comes from the build so every includer agrees.
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>
#include <vector>

namespace gatekeeper {

namespace {

constexpr const char* kServiceName = "gatekeeper";
constexpr const char* kServiceVersion = "0.1.0";

std::optional<std::string> optional_header(const httplib::Request& req, const std::string& name) {
    if (!req.has_header(name)) return std::nullopt;
    return req.get_header_value(name);
}

/**
 * @brief Client address from an X-Forwarded-For chain
 *
 * Walks right to left: each trusted hop appended the address it saw, so the
 * first untrusted entry is the client. Entries left of it are client-supplied.
 * If every hop is trusted, the leftmost one is used.
 */
std::string resolve_forwarded_for(std::string_view xff, const TrustedProxyList& trusted) {
    std::vector<std::string> hops;
    size_t start = 0;
    while (start <= xff.size()) {
        const auto comma = xff.find(',', start);
        const auto end = (comma == std::string_view::npos) ? xff.size() : comma;
        if (auto hop = utils::trim(xff.substr(start, end - start)); !hop.empty()) {
            hops.push_back(std::move(hop));
        }
        start = end + 1;
    }
    if (hops.empty()) return "";

    for (auto it = hops.rbegin(); it != hops.rend(); ++it) {
        if (!trusted.contains(*it)) return *it;
    }
    return hops.front();
}

/// Copy gateway headers onto the httplib response, replacing existing values
void copy_headers(const GatewayResponse& from, httplib::Response& res) {
    for (const auto& [name, value] : from.headers) {
        res.headers.erase(name);
        res.set_header(name, value);
    }
}

void write_response(const GatewayResponse& from, httplib::Response& res) {
    res.status = from.status;
    if (!from.body.empty() || !from.content_type.empty()) {
        res.set_content(from.body, from.content_type);
    }
    copy_headers(from, res);
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<const SecurityGateway> gateway, ServerConfig config)
    : gateway_(std::move(gateway)),
      config_(std::move(config)),
      trusted_proxies_(config_.trusted_proxies),
      started_at_(utils::now()) {
    if (!gateway_) {
        throw std::invalid_argument("HttpServer requires a SecurityGateway");
    }
}

HttpServer::~HttpServer() = default;

// ============================================================================
// Request context
// ============================================================================

RequestContext HttpServer::build_context(const httplib::Request& req,
                                         bool generate_request_id) const {
    RequestContext ctx;
    ctx.method = req.method;
    ctx.path = req.path;
    ctx.origin = optional_header(req, http::kOriginHeader);
    ctx.client_identity = optional_header(req, http::kUserAgentHeader);

    ctx.request_id = req.get_header_value(http::kRequestIdHeader);
    if (ctx.request_id.empty() && generate_request_id) {
        ctx.request_id = utils::generate_uuid();
    }

    const bool via_trusted_proxy = trusted_proxies_.contains(req.remote_addr);

    if (!req.remote_addr.empty()) {
        ctx.client_address = std::string(TrustedProxyList::strip_ipv6_mapped(req.remote_addr));
    }
    if (via_trusted_proxy) {
        const auto xff = req.get_header_value(http::kForwardedForHeader);
        if (auto forwarded = resolve_forwarded_for(xff, trusted_proxies_); !forwarded.empty()) {
            ctx.client_address = std::move(forwarded);
        }
    }

    if (config_.tls.enabled) {
        ctx.scheme = Scheme::HTTPS;
    } else if (via_trusted_proxy &&
               utils::to_lower(req.get_header_value(http::kForwardedProtoHeader)) == "https") {
        ctx.scheme = Scheme::HTTPS;
    }
    return ctx;
}

// ============================================================================
// Lifecycle
// ============================================================================

void HttpServer::start() {
    std::unique_ptr<httplib::Server> svr_ptr;
    if (config_.tls.enabled) {
        const char* ca_cert_path = (config_.tls.require_client_cert && !config_.tls.ca_file.empty())
            ? config_.tls.ca_file.c_str() : nullptr;
        svr_ptr = std::make_unique<httplib::SSLServer>(
            config_.tls.cert_file.c_str(), config_.tls.key_file.c_str(), ca_cert_path);
        utils::log::info(std::format("TLS enabled: cert={}, key={}, mTLS={}",
            config_.tls.cert_file, config_.tls.key_file,
            config_.tls.require_client_cert ? "required" : "off"));
    } else {
        svr_ptr = std::make_unique<httplib::Server>();
    }
    if (!svr_ptr->is_valid()) {
        throw std::runtime_error("Failed to initialize HTTP server (check TLS certificate/key)");
    }

    const size_t pool_size = config_.thread_pool_size;
    svr_ptr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    install(*svr_ptr);

    httplib::Server* svr = nullptr;
    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        server_ = std::move(svr_ptr);
        svr = server_.get();
    }

    utils::log::info(std::format("Starting {} on {}:{} ({}, {} threads)",
        kServiceName, config_.host, config_.port,
        config_.tls.enabled ? "HTTPS" : "HTTP", config_.thread_pool_size));

    if (!svr->listen(config_.host, config_.port)) {
        throw std::runtime_error(
            std::format("Failed to start HTTP server on {}:{}", config_.host, config_.port));
    }
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lock(server_mutex_);
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

// ============================================================================
// Gateway hooks
// ============================================================================

void HttpServer::install(httplib::Server& svr) {
    install_gateway(svr);
    register_routes(svr);
}

void HttpServer::install_gateway(httplib::Server& svr) {
    svr.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        const auto ctx = build_context(req, /*generate_request_id=*/false);

        if (auto preflight = gateway_->intercept(ctx)) {
            write_response(*preflight, res);
            return httplib::Server::HandlerResponse::Handled;
        }

        if (rate_limit_check_ && !rate_limit_check_(gateway_->rate_limit_key(ctx))) {
            res.status = httplib::StatusCode::TooManyRequests_429;
            res.set_content(R"({"success":false,"error":"Rate limit exceeded"})",
                            http::kJsonContentType);
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    // Runs for every written response: routed, short-circuited or error
    svr.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        const auto ctx = build_context(req, /*generate_request_id=*/true);

        GatewayResponse outbound;
        outbound.status = res.status;
        if (res.has_header(std::string(http::kVary))) {
            outbound.set_header(http::kVary, res.get_header_value(std::string(http::kVary)));
        }
        gateway_->finalize(ctx, outbound);
        copy_headers(outbound, res);

        utils::log::info(std::format("{} {} {} request_id={}",
            ctx.method, ctx.path, res.status, ctx.request_id));
    });
}

// ============================================================================
// Routes
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get("/health-simple", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get("/ping", [this](const httplib::Request& req, httplib::Response& res) {
        handle_ping(req, res);
    });
    svr.Post("/api/v1/fields/validate", [this](const httplib::Request& req, httplib::Response& res) {
        handle_validate_fields(req, res);
    });
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        utils::now() - started_at_);
    const nlohmann::json body = {
        {"status", "ok"},
        {"service", kServiceName},
        {"version", kServiceVersion},
        {"timestamp", utils::format_timestamp(utils::now())},
        {"uptime_seconds", uptime.count()},
    };
    res.set_content(body.dump(), http::kJsonContentType);
}

void HttpServer::handle_ping(const httplib::Request&, httplib::Response& res) {
    res.set_content(R"({"status":"ok","message":"pong"})", http::kJsonContentType);
}

void HttpServer::handle_validate_fields(const httplib::Request& req, httplib::Response& res) {
    write_response(FieldValidationHandler::handle(req.body), res);
}

} // namespace gatekeeper
