#pragma once

#include "tradelog/rpc.hpp"
#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace tradelog {

class HttpServer {
public:
    HttpServer(std::shared_ptr<TradeJournal> journal, std::shared_ptr<RpcServer> rpc_server);
    ~HttpServer();

    // Blocks until stop() is called or listening fails
    bool start(const std::string& host = "0.0.0.0", int port = 8003);
    void stop();

private:
    std::unique_ptr<httplib::Server> server_;
    std::shared_ptr<TradeJournal> journal_;
    std::shared_ptr<RpcServer> rpc_server_;
    std::shared_ptr<spdlog::logger> logger_;

    void setup_routes();
};

} // namespace tradelog
