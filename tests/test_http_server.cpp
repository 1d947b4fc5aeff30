#include <catch2/catch_test_macros.hpp>
#include "server/http_server.hpp"
#include "server/security_gateway.hpp"
#include "security/rate_limit_key.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace gatekeeper;

namespace {

std::shared_ptr<const SecurityGateway> make_gateway() {
    return std::make_shared<const SecurityGateway>(SecurityPolicyConfig{});
}

ServerConfig proxied_config(std::vector<std::string> trusted) {
    ServerConfig cfg;
    cfg.trusted_proxies = std::move(trusted);
    return cfg;
}

httplib::Request make_request(const std::string& peer) {
    httplib::Request req;
    req.method = "GET";
    req.path = "/api/v1/items";
    req.remote_addr = peer;
    return req;
}

// Gateway-wired listener on an ephemeral loopback port
class TestListener {
public:
    explicit TestListener(HttpServer& server) {
        server.install(svr_);
        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~TestListener() {
        svr_.stop();
        thread_.join();
    }

    [[nodiscard]] httplib::Client client() const {
        return httplib::Client("127.0.0.1", port_);
    }

private:
    httplib::Server svr_;
    std::thread thread_;
    int port_ = -1;
};

} // namespace

// ============================================================================
// Request context
// ============================================================================

TEST_CASE("HttpServer: forwarded headers ignored from untrusted peer", "[http_server][proxy]") {
    const HttpServer server(make_gateway(), proxied_config({"10.0.0.0/8"}));
    auto req = make_request("203.0.113.5");
    req.set_header("X-Forwarded-Proto", "https");
    req.set_header("X-Forwarded-For", "198.51.100.7");

    const auto ctx = server.build_context(req, false);
    CHECK(ctx.scheme == Scheme::HTTP);
    REQUIRE(ctx.client_address.has_value());
    CHECK(*ctx.client_address == "203.0.113.5");
}

TEST_CASE("HttpServer: trusted proxy supplies scheme and client address", "[http_server][proxy]") {
    const HttpServer server(make_gateway(), proxied_config({"10.0.0.0/8"}));
    auto req = make_request("10.0.0.2");
    req.set_header("X-Forwarded-Proto", "HTTPS");
    req.set_header("X-Forwarded-For", "198.51.100.7");

    const auto ctx = server.build_context(req, false);
    CHECK(ctx.scheme == Scheme::HTTPS);
    CHECK(ctx.client_address == "198.51.100.7");
}

TEST_CASE("HttpServer: client-supplied X-Forwarded-For entries are skipped", "[http_server][proxy]") {
    const HttpServer server(make_gateway(), proxied_config({"10.0.0.0/8"}));

    auto spoofed = make_request("10.0.0.2");
    spoofed.set_header("X-Forwarded-For", "6.6.6.6, 198.51.100.7");
    CHECK(server.build_context(spoofed, false).client_address == "198.51.100.7");

    auto chained = make_request("10.0.0.2");
    chained.set_header("X-Forwarded-For", "198.51.100.7, 10.0.0.9");
    CHECK(server.build_context(chained, false).client_address == "198.51.100.7");

    auto internal = make_request("10.0.0.2");
    internal.set_header("X-Forwarded-For", "10.0.0.3, 10.0.0.4");
    CHECK(server.build_context(internal, false).client_address == "10.0.0.3");

    auto blank = make_request("10.0.0.2");
    blank.set_header("X-Forwarded-For", " , ");
    CHECK(server.build_context(blank, false).client_address == "10.0.0.2");
}

TEST_CASE("HttpServer: IPv6-mapped peer address is unwrapped", "[http_server][proxy]") {
    const HttpServer server(make_gateway(), proxied_config({"10.0.0.0/8"}));

    CHECK(server.build_context(make_request("::ffff:203.0.113.5"), false).client_address ==
          "203.0.113.5");

    auto via_proxy = make_request("::ffff:10.0.0.2");
    via_proxy.set_header("X-Forwarded-Proto", "https");
    CHECK(server.build_context(via_proxy, false).scheme == Scheme::HTTPS);
}

TEST_CASE("HttpServer: TLS listener is always https", "[http_server]") {
    ServerConfig cfg;
    cfg.tls.enabled = true;
    const HttpServer server(make_gateway(), cfg);
    CHECK(server.build_context(make_request("203.0.113.5"), false).scheme == Scheme::HTTPS);
}

TEST_CASE("HttpServer: missing User-Agent stays absent", "[http_server]") {
    const HttpServer server(make_gateway(), ServerConfig{});
    const auto ctx = server.build_context(make_request("203.0.113.5"), false);

    CHECK_FALSE(ctx.client_identity.has_value());
    CHECK_FALSE(ctx.origin.has_value());
    CHECK(RateLimitKeyDeriver::derive_key(ctx) ==
          RateLimitKeyDeriver::derive_key("203.0.113.5", "unknown"));
}

TEST_CASE("HttpServer: request id echoed or generated on demand", "[http_server]") {
    const HttpServer server(make_gateway(), ServerConfig{});

    auto tagged = make_request("203.0.113.5");
    tagged.set_header("X-Request-ID", "abc-123");
    CHECK(server.build_context(tagged, true).request_id == "abc-123");

    const auto plain = make_request("203.0.113.5");
    CHECK(server.build_context(plain, false).request_id.empty());
    CHECK(server.build_context(plain, true).request_id.size() == 36);
}

TEST_CASE("HttpServer: null gateway is rejected", "[http_server]") {
    CHECK_THROWS_AS(HttpServer(nullptr, ServerConfig{}), std::invalid_argument);
}

// ============================================================================
// Gateway hooks over a live listener
// ============================================================================

TEST_CASE("HttpServer: unrouted 404 is hardened", "[http_server][hooks]") {
    HttpServer server(make_gateway(), ServerConfig{});
    TestListener listener(server);
    auto cli = listener.client();

    const auto res = cli.Get("/does-not-exist");
    REQUIRE(res);
    CHECK(res->status == 404);
    CHECK(res->get_header_value("X-Content-Type-Options") == "nosniff");
    CHECK(res->get_header_value("X-Frame-Options") == "DENY");
    CHECK(res->has_header("Content-Security-Policy"));
    CHECK_FALSE(res->has_header("Strict-Transport-Security"));
    CHECK_FALSE(res->get_header_value("X-Request-ID").empty());
}

TEST_CASE("HttpServer: rate limit check receives derived key and answers 429", "[http_server][hooks]") {
    HttpServer server(make_gateway(), ServerConfig{});
    const auto blocked_key = RateLimitKeyDeriver::derive_key("127.0.0.1", "blocked-agent");

    std::mutex keys_mutex;
    std::vector<std::string> seen_keys;
    server.set_rate_limit_check([&](const std::string& key) {
        std::lock_guard<std::mutex> lock(keys_mutex);
        seen_keys.push_back(key);
        return key != blocked_key;
    });

    TestListener listener(server);
    auto cli = listener.client();

    const auto limited = cli.Get("/ping", httplib::Headers{{"User-Agent", "blocked-agent"}});
    REQUIRE(limited);
    CHECK(limited->status == 429);
    CHECK(limited->body.find("Rate limit exceeded") != std::string::npos);
    CHECK(limited->get_header_value("X-Content-Type-Options") == "nosniff");
    CHECK(limited->has_header("Content-Security-Policy"));

    const auto allowed = cli.Get("/ping", httplib::Headers{{"User-Agent", "other-agent"}});
    REQUIRE(allowed);
    CHECK(allowed->status == 200);
    CHECK(allowed->get_header_value("X-Content-Type-Options") == "nosniff");

    std::lock_guard<std::mutex> lock(keys_mutex);
    REQUIRE(seen_keys.size() == 2);
    CHECK(seen_keys[0] == blocked_key);
    CHECK(seen_keys[1] == RateLimitKeyDeriver::derive_key("127.0.0.1", "other-agent"));
}

TEST_CASE("HttpServer: preflight bypasses rate limit and routing", "[http_server][hooks]") {
    HttpServer server(make_gateway(), ServerConfig{});
    std::atomic<int> checks{0};
    server.set_rate_limit_check([&checks](const std::string&) {
        ++checks;
        return false;
    });

    TestListener listener(server);
    auto cli = listener.client();

    const auto res = cli.Options("/api/v1/anything",
        httplib::Headers{{"Origin", "http://localhost:3000"},
                         {"Access-Control-Request-Method", "POST"}});
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(res->body.empty());
    CHECK(res->get_header_value("Access-Control-Allow-Origin") == "http://localhost:3000");
    CHECK(res->get_header_value("Access-Control-Allow-Credentials") == "true");
    CHECK(res->get_header_value("Vary") == "Origin");
    CHECK(res->has_header("Content-Security-Policy"));
    CHECK(checks.load() == 0);
}

TEST_CASE("HttpServer: HSTS only when a trusted proxy forwarded https", "[http_server][hooks]") {
    HttpServer server(make_gateway(), proxied_config({"127.0.0.1"}));
    TestListener listener(server);
    auto cli = listener.client();

    const auto secure = cli.Get("/ping", httplib::Headers{{"X-Forwarded-Proto", "https"}});
    REQUIRE(secure);
    CHECK(secure->get_header_value("Strict-Transport-Security") ==
          "max-age=31536000; includeSubDomains");

    const auto plain = cli.Get("/ping");
    REQUIRE(plain);
    CHECK_FALSE(plain->has_header("Strict-Transport-Security"));
}

TEST_CASE("HttpServer: field validation route", "[http_server][hooks]") {
    HttpServer server(make_gateway(), ServerConfig{});
    TestListener listener(server);
    auto cli = listener.client();

    const auto res = cli.Post("/api/v1/fields/validate",
        R"({"email":"bad","name":"<i>Ann</i>"})", "application/json");
    REQUIRE(res);
    CHECK(res->status == 400);
    CHECK(res->body.find(R"("value":"iAnn/i")") != std::string::npos);
    CHECK(res->get_header_value("X-Frame-Options") == "DENY");
}
