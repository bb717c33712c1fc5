#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "db/backend_factory.hpp"
#include "gateway/query_gateway.hpp"
#include "server/gateway_http_server.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>

using namespace dpgw;

// Global instances for signal handling
std::shared_ptr<QueryGateway> g_gateway;
std::shared_ptr<GatewayHttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    if (g_server) {
        g_server->stop();
    }
    if (g_gateway) {
        g_gateway->close();
    }
    exit(0);
}

namespace {

/**
 * @brief One request per line: "<sql>" or "@<product_id> <sql>"
 */
void run_stdin_loop(QueryGateway& gateway) {
    utils::log::info("Reading requests from stdin (\"@<product_id> <sql>\" for data products)");

    std::string line;
    while (std::getline(std::cin, line)) {
        const auto text = utils::trim(line);
        if (text.empty()) continue;

        ResponseEnvelope envelope;
        if (text.front() == '@') {
            const auto space = text.find(' ');
            DataProductRequest request;
            request.product_id = text.substr(1, space == std::string::npos ? std::string::npos : space - 1);
            request.sql = space == std::string::npos ? "" : text.substr(space + 1);
            envelope = gateway.get_data_product(std::move(request));
        } else {
            QueryRequest request;
            request.sql = text;
            envelope = gateway.execute(std::move(request));
        }
        std::cout << envelope.to_json() << std::endl;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Data Product Gateway starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/gateway.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        auto config = std::move(config_result.config);
        utils::log::set_level(utils::log::parse_level(config.logging.level));

        utils::log::info("[2/4] Registering backends");
        auto factory = BackendFactory::with_builtin_backends();
        utils::log::info(std::format("Supported backends: {}", utils::join(factory.supported_types(), ", ")));

        utils::log::info(std::format("[3/4] Initializing gateway on '{}' backend", config.backend.type));
        const auto server_config = config.server;
        g_gateway = std::make_shared<QueryGateway>(std::move(config), std::move(factory));
        if (!g_gateway->initialize()) {
            utils::log::error("Gateway initialization failed");
            return 1;
        }

        if (server_config.enabled) {
            utils::log::info("[4/4] Starting HTTP server");
            g_server = std::make_shared<GatewayHttpServer>(g_gateway, server_config);
            g_server->start();
        } else {
            utils::log::info("[4/4] HTTP server disabled");
            run_stdin_loop(*g_gateway);
        }

        g_gateway->close();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }

    return 0;
}
