#pragma once
#include <string>
#include <memory>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "tradelog/journal.hpp"

namespace tradelog {

class RpcServer {
public:
    explicit RpcServer(std::shared_ptr<TradeJournal> journal,
                       TextEncoding default_encoding = TextEncoding::Auto);

    // Main RPC handler
    std::string handle_request(const std::string& request);

    // Individual RPC methods
    nlohmann::json import_csv(const nlohmann::json& params);
    nlohmann::json add_execution(const nlohmann::json& params);
    nlohmann::json delete_execution(const nlohmann::json& params);
    nlohmann::json clear_executions(const nlohmann::json& params);
    nlohmann::json get_executions(const nlohmann::json& params);
    nlohmann::json get_trades(const nlohmann::json& params);
    nlohmann::json get_summary(const nlohmann::json& params);
    nlohmann::json resample(const nlohmann::json& params);
    nlohmann::json recalculate(const nlohmann::json& params);

    // Shared with the HTTP /import route
    nlohmann::json import_bytes(const std::string& bytes, TextEncoding encoding);

    TextEncoding default_encoding() const { return default_encoding_; }

private:
    std::shared_ptr<TradeJournal> journal_;
    TextEncoding default_encoding_;
    std::shared_ptr<spdlog::logger> logger_;

    // Helper methods
    nlohmann::json create_error_response(int code, const std::string& message, const nlohmann::json& id = nullptr);
    nlohmann::json create_success_response(const nlohmann::json& result, const nlohmann::json& id = nullptr);
    std::string serialize_response(const nlohmann::json& response);

    // Validation helpers
    TextEncoding encoding_param(const nlohmann::json& params) const;
    std::optional<Date> date_param(const nlohmann::json& params, const char* key) const;
};

// Thrown by RPC methods for bad parameters; mapped to InvalidParams
class InvalidParams : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Thrown when a referenced execution does not exist
class ExecutionNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Error codes
enum class RpcErrorCode {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,

    // Custom error codes
    FormatUndetected = -32001,
    NoRecordsParsed = -32002,
    HeaderMissing = -32003,
    ExecutionNotFound = -32004,
};

RpcErrorCode to_rpc_error(ImportErrorCode code);

} // namespace tradelog
