#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "server/http_server.hpp"
#include "server/security_gateway.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <memory>

using namespace gatekeeper;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

static void log_policy_summary(const GatekeeperConfig& config, const SecurityGateway& gateway) {
    const auto& cors = config.security.cors;
    utils::log::info(std::format("CORS: {} allowed origin pattern(s), credentials={}, max_age={}s",
        cors.allowed_origins.size(), utils::booltostr(cors.allow_credentials),
        cors.max_age_seconds));
    for (const auto& origin : cors.allowed_origins) {
        utils::log::debug(std::format("  allowed origin: {}", origin));
    }
    utils::log::info(std::format("Content-Security-Policy: {}",
        gateway.headers().content_security_policy()));
    utils::log::info(std::format("Strict-Transport-Security (https only): {}",
        gateway.headers().strict_transport_security()));
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Gatekeeper starting...");

        std::string config_file = "config/gatekeeper.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("Loading configuration from {}", config_file));
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return EXIT_FAILURE;
        }
        const GatekeeperConfig config = std::move(loaded.config);

        utils::log::set_level(utils::log::parse_level(config.logging.level));

        const auto gateway = std::make_shared<const SecurityGateway>(config.security);
        log_policy_summary(config, *gateway);

        g_server = std::make_shared<HttpServer>(gateway, config.server);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        g_server->start();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
