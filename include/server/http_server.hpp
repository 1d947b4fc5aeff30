#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "security/trusted_proxy_list.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace gatekeeper {

class SecurityGateway;

/**
 * @brief cpp-httplib transport wired through the SecurityGateway
 *
 * - pre-routing:  preflight short-circuit, then the host's rate-limit check
 * - routing:      built-in routes (/health, /health-simple, /ping,
 *                 /api/v1/fields/validate)
 * - post-routing: CORS + security headers on every response, access log
 *
 * X-Forwarded-For / X-Forwarded-Proto are only honoured when the direct
 * peer is listed in server.trusted_proxies. The client address is the
 * rightmost X-Forwarded-For hop that is not itself a trusted proxy.
 */
class HttpServer {
public:
    /// Host-supplied counter: return false to reject the request with 429
    using RateLimitCheck = std::function<bool(const std::string& key)>;

    HttpServer(std::shared_ptr<const SecurityGateway> gateway, ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Blocks until stop()
    /// @throws std::runtime_error if the listener cannot bind
    void start();
    void stop();

    void set_rate_limit_check(RateLimitCheck check) {
        rate_limit_check_ = std::move(check);
    }

    /// Wire gateway hooks and routes onto svr; start() does this for its own listener
    void install(httplib::Server& svr);

    /// Request view consumed by the gateway. Generates a request id only when asked.
    [[nodiscard]] RequestContext build_context(const httplib::Request& req,
                                               bool generate_request_id) const;

private:
    void install_gateway(httplib::Server& svr);
    void register_routes(httplib::Server& svr);

    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_ping(const httplib::Request& req, httplib::Response& res);
    void handle_validate_fields(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<const SecurityGateway> gateway_;
    const ServerConfig config_;
    const TrustedProxyList trusted_proxies_;
    RateLimitCheck rate_limit_check_;
    const std::chrono::system_clock::time_point started_at_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace gatekeeper
