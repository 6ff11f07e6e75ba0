#include "tradelog/http_server.hpp"
#include "tradelog/json.hpp"
#include "tradelog/logging.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>

namespace tradelog {

namespace {

void set_json(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

} // namespace

HttpServer::HttpServer(std::shared_ptr<TradeJournal> journal, std::shared_ptr<RpcServer> rpc_server)
    : server_(std::make_unique<httplib::Server>()),
      journal_(std::move(journal)),
      rpc_server_(std::move(rpc_server)) {
    logger_ = get_logger("http_server");
    setup_routes();
}

HttpServer::~HttpServer() = default;

void HttpServer::setup_routes() {
    // Health check endpoint
    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json health = {
            {"status", "healthy"},
            {"service", "tradelog"},
            {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count()}
        };
        set_json(res, health);
    });

    server_->Get("/ping", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("pong", "text/plain");
    });

    // JSON-RPC endpoint
    server_->Post("/jsonrpc", [this](const httplib::Request& req, httplib::Response& res) {
        logger_->debug("Received JSON-RPC request ({} bytes)", req.body.size());
        res.set_content(rpc_server_->handle_request(req.body), "application/json");
    });

    // Raw broker export upload; the body is the file exactly as saved
    server_->Post("/import", [this](const httplib::Request& req, httplib::Response& res) {
        TextEncoding encoding = rpc_server_->default_encoding();
        if (req.has_param("encoding")) {
            auto requested = parse_encoding(req.get_param_value("encoding"));
            if (!requested) {
                set_json(res, {{"error", "Unknown encoding"}}, 400);
                return;
            }
            encoding = *requested;
        }

        try {
            set_json(res, rpc_server_->import_bytes(req.body, encoding));
        } catch (const ImportError& e) {
            logger_->warn("Import rejected: {}", e.what());
            set_json(res, {
                {"error", e.what()},
                {"code", static_cast<int>(to_rpc_error(e.code()))}
            }, 422);
        }
    });

    server_->Get("/executions", [this](const httplib::Request&, httplib::Response& res) {
        set_json(res, journal_->executions());
    });

    server_->Get("/trades", [this](const httplib::Request&, httplib::Response& res) {
        set_json(res, journal_->trades());
    });

    server_->Get("/summary", [this](const httplib::Request&, httplib::Response& res) {
        set_json(res, journal_->summary());
    });

    // Error handler
    server_->set_exception_handler([this](const auto&, auto& res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            logger_->error("Request failed: {}", e.what());
            set_json(res, {
                {"error", "Internal server error"},
                {"message", e.what()}
            }, 500);
        }
    });
}

bool HttpServer::start(const std::string& host, int port) {
    logger_->info("Starting HTTP server on {}:{}", host, port);

    if (!server_->listen(host.c_str(), port)) {
        logger_->error("Failed to start HTTP server on port {}", port);
        return false;
    }

    logger_->info("HTTP server stopped");
    return true;
}

void HttpServer::stop() {
    logger_->info("Stopping HTTP server");
    server_->stop();
}

} // namespace tradelog
