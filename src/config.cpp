#include "tradelog/config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace tradelog {

namespace {

int parse_port(const std::string& text) {
    size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid port: " + text);
    }
    if (consumed != text.size() || port <= 0 || port > 65535) {
        throw std::runtime_error("Invalid port: " + text);
    }
    return port;
}

TextEncoding encoding_from(const std::string& text) {
    auto encoding = parse_encoding(text);
    if (!encoding) {
        throw std::runtime_error("Invalid default_encoding: " + text);
    }
    return *encoding;
}

} // namespace

ServerConfig load_config(const std::string& path) {
    ServerConfig config;
    if (path.empty()) {
        return config;
    }

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file " + path);
    }

    try {
        auto json = nlohmann::json::parse(in);
        config.host = json.value("host", config.host);
        config.port = json.value("port", config.port);
        config.log_level = json.value("log_level", config.log_level);
        config.data_file = json.value("data_file", config.data_file);
        if (json.contains("default_encoding")) {
            config.default_encoding = encoding_from(json["default_encoding"].get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    if (config.port <= 0 || config.port > 65535) {
        throw std::runtime_error("Invalid port: " + std::to_string(config.port));
    }
    return config;
}

void apply_env_overrides(ServerConfig& config) {
    if (const char* host = std::getenv("TRADELOG_HOST")) {
        config.host = host;
    }
    if (const char* port = std::getenv("TRADELOG_PORT")) {
        config.port = parse_port(port);
    }
    if (const char* level = std::getenv("TRADELOG_LOG_LEVEL")) {
        config.log_level = level;
    }
    if (const char* data_file = std::getenv("TRADELOG_DATA_FILE")) {
        config.data_file = data_file;
    }
}

} // namespace tradelog
