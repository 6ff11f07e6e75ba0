#include "tradelog/config.hpp"
#include "tradelog/http_server.hpp"
#include "tradelog/journal.hpp"
#include "tradelog/logging.hpp"
#include "tradelog/rpc.hpp"
#include <memory>
#include <signal.h>
#include <spdlog/spdlog.h>

// Global server pointer for signal handling
std::unique_ptr<tradelog::HttpServer> g_server;

void signal_handler(int signal) {
    if (g_server) {
        spdlog::info("Received signal {}, shutting down server...", signal);
        g_server->stop();
    }
}

int main(int argc, char** argv) {
    try {
        tradelog::ServerConfig config = tradelog::load_config(argc > 1 ? argv[1] : "");
        tradelog::apply_env_overrides(config);
        tradelog::set_log_level(config.log_level);

        spdlog::info("Starting TradeLog server");
        spdlog::info("========================");

        auto journal = std::make_shared<tradelog::TradeJournal>(config.data_file);
        journal->print_summary();

        auto rpc = std::make_shared<tradelog::RpcServer>(journal, config.default_encoding);
        g_server = std::make_unique<tradelog::HttpServer>(journal, rpc);

        // Set up signal handling
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        spdlog::info("Health check: http://localhost:{}/health", config.port);
        spdlog::info("JSON-RPC endpoint: http://localhost:{}/jsonrpc", config.port);
        spdlog::info("CSV upload: http://localhost:{}/import", config.port);

        if (!g_server->start(config.host, config.port)) {
            spdlog::error("Failed to start HTTP server");
            return 1;
        }
        g_server.reset();

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
