#include "tradelog/rpc.hpp"
#include "tradelog/json.hpp"
#include "tradelog/logging.hpp"
#include "tradelog/resampler.hpp"

namespace tradelog {

RpcErrorCode to_rpc_error(ImportErrorCode code) {
    switch (code) {
        case ImportErrorCode::FormatUndetected:
            return RpcErrorCode::FormatUndetected;
        case ImportErrorCode::HeaderMissing:
            return RpcErrorCode::HeaderMissing;
        case ImportErrorCode::NoRecordsParsed:
            return RpcErrorCode::NoRecordsParsed;
    }
    return RpcErrorCode::InternalError;
}

RpcServer::RpcServer(std::shared_ptr<TradeJournal> journal, TextEncoding default_encoding)
    : journal_(std::move(journal)), default_encoding_(default_encoding) {
    logger_ = get_logger("rpc_server");
    logger_->info("RPC Server initialized");
}

std::string RpcServer::handle_request(const std::string& request) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(request);
    } catch (const nlohmann::json::parse_error& e) {
        logger_->error("JSON parse error: {}", e.what());
        return serialize_response(create_error_response(
            static_cast<int>(RpcErrorCode::ParseError),
            "Parse error: " + std::string(e.what())
        ));
    }

    // Validate JSON-RPC 2.0 structure
    if (!json.is_object() || !json.contains("jsonrpc") || json["jsonrpc"] != "2.0") {
        return serialize_response(create_error_response(
            static_cast<int>(RpcErrorCode::InvalidRequest),
            "Invalid JSON-RPC 2.0 request"
        ));
    }

    if (!json.contains("method") || !json["method"].is_string()) {
        return serialize_response(create_error_response(
            static_cast<int>(RpcErrorCode::InvalidRequest),
            "Missing 'method' field"
        ));
    }

    std::string method = json["method"];
    nlohmann::json params = json.value("params", nlohmann::json::object());
    nlohmann::json id = json.value("id", nlohmann::json(nullptr));

    logger_->debug("RPC call: {}", method);

    try {
        // Route to appropriate method
        nlohmann::json result;
        if (method == "import_csv") {
            result = import_csv(params);
        } else if (method == "add_execution") {
            result = add_execution(params);
        } else if (method == "delete_execution") {
            result = delete_execution(params);
        } else if (method == "clear_executions") {
            result = clear_executions(params);
        } else if (method == "get_executions") {
            result = get_executions(params);
        } else if (method == "get_trades") {
            result = get_trades(params);
        } else if (method == "get_summary") {
            result = get_summary(params);
        } else if (method == "resample") {
            result = resample(params);
        } else if (method == "recalculate") {
            result = recalculate(params);
        } else {
            return serialize_response(create_error_response(
                static_cast<int>(RpcErrorCode::MethodNotFound),
                "Method not found: " + method,
                id
            ));
        }

        return serialize_response(create_success_response(result, id));

    } catch (const ImportError& e) {
        // Surfaced verbatim so the user sees why the file was rejected
        logger_->warn("Import rejected: {}", e.what());
        return serialize_response(create_error_response(
            static_cast<int>(to_rpc_error(e.code())), e.what(), id));
    } catch (const ExecutionNotFound& e) {
        return serialize_response(create_error_response(
            static_cast<int>(RpcErrorCode::ExecutionNotFound), e.what(), id));
    } catch (const std::invalid_argument& e) {
        logger_->warn("Invalid params for {}: {}", method, e.what());
        return serialize_response(create_error_response(
            static_cast<int>(RpcErrorCode::InvalidParams), e.what(), id));
    } catch (const nlohmann::json::exception& e) {
        logger_->warn("Invalid params for {}: {}", method, e.what());
        return serialize_response(create_error_response(
            static_cast<int>(RpcErrorCode::InvalidParams), e.what(), id));
    } catch (const std::exception& e) {
        logger_->error("RPC error: {}", e.what());
        return serialize_response(create_error_response(
            static_cast<int>(RpcErrorCode::InternalError),
            "Internal error: " + std::string(e.what()),
            id
        ));
    }
}

nlohmann::json RpcServer::import_csv(const nlohmann::json& params) {
    if (!params.contains("content") || !params["content"].is_string()) {
        throw InvalidParams("'content' must be a string");
    }
    return import_bytes(params["content"].get<std::string>(), encoding_param(params));
}

nlohmann::json RpcServer::import_bytes(const std::string& bytes, TextEncoding encoding) {
    ImportResult result = journal_->import_document(bytes, encoding);
    return nlohmann::json{
        {"layout", to_string(result.layout)},
        {"imported", result.imported},
        {"skipped_rows", result.skipped_rows},
        {"trade_count", result.trade_count}
    };
}

nlohmann::json RpcServer::add_execution(const nlohmann::json& params) {
    ExecutionRecord record = params.get<ExecutionRecord>();
    ExecutionId id = journal_->add_execution(record);
    return nlohmann::json{
        {"id", id},
        {"trade_count", journal_->trades().size()}
    };
}

nlohmann::json RpcServer::delete_execution(const nlohmann::json& params) {
    if (!params.contains("id") || !params["id"].is_number_integer()) {
        throw InvalidParams("'id' must be an integer");
    }
    auto id = params["id"].get<ExecutionId>();
    if (!journal_->remove_execution(id)) {
        throw ExecutionNotFound("Execution not found: " + std::to_string(id));
    }
    return nlohmann::json{
        {"deleted", id},
        {"trade_count", journal_->trades().size()}
    };
}

nlohmann::json RpcServer::clear_executions(const nlohmann::json& params) {
    (void)params;
    journal_->clear_executions();
    return nlohmann::json{{"success", true}};
}

nlohmann::json RpcServer::get_executions(const nlohmann::json& params) {
    (void)params;
    return journal_->executions();
}

nlohmann::json RpcServer::get_trades(const nlohmann::json& params) {
    return journal_->trades_between(date_param(params, "from"), date_param(params, "to"));
}

nlohmann::json RpcServer::get_summary(const nlohmann::json& params) {
    return journal_->summary(date_param(params, "from"), date_param(params, "to"));
}

nlohmann::json RpcServer::resample(const nlohmann::json& params) {
    if (!params.contains("bars") || !params["bars"].is_array()) {
        throw InvalidParams("'bars' must be an array");
    }
    std::string timeframe_str = params.value("timeframe", "WEEK");
    auto timeframe = parse_timeframe(timeframe_str);
    if (!timeframe) {
        throw InvalidParams("Unknown timeframe: " + timeframe_str);
    }

    auto bars = params["bars"].get<std::vector<Bar>>();
    return nlohmann::json{
        {"timeframe", to_string(*timeframe)},
        {"bars", tradelog::resample(bars, *timeframe)}
    };
}

nlohmann::json RpcServer::recalculate(const nlohmann::json& params) {
    (void)params;
    return nlohmann::json{{"trade_count", journal_->recalculate()}};
}

nlohmann::json RpcServer::create_error_response(int code, const std::string& message, const nlohmann::json& id) {
    nlohmann::json response;
    response["jsonrpc"] = "2.0";
    response["error"] = {
        {"code", code},
        {"message", message}
    };
    response["id"] = id;
    return response;
}

nlohmann::json RpcServer::create_success_response(const nlohmann::json& result, const nlohmann::json& id) {
    nlohmann::json response;
    response["jsonrpc"] = "2.0";
    response["result"] = result;
    response["id"] = id;
    return response;
}

std::string RpcServer::serialize_response(const nlohmann::json& response) {
    return response.dump();
}

TextEncoding RpcServer::encoding_param(const nlohmann::json& params) const {
    if (!params.contains("encoding")) {
        return default_encoding_;
    }
    std::string text = params["encoding"].get<std::string>();
    auto encoding = parse_encoding(text);
    if (!encoding) {
        throw InvalidParams("Unknown encoding: " + text);
    }
    return *encoding;
}

std::optional<Date> RpcServer::date_param(const nlohmann::json& params, const char* key) const {
    if (!params.is_object() || !params.contains(key) || params[key].is_null()) {
        return std::nullopt;
    }
    std::string text = params[key].get<std::string>();
    auto date = Date::parse(text);
    if (!date) {
        throw InvalidParams(std::string("Invalid '") + key + "' date: " + text);
    }
    return date;
}

} // namespace tradelog
