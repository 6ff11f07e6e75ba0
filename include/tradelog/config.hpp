#pragma once

#include "tradelog/encoding.hpp"
#include <string>

namespace tradelog {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8003;
    std::string log_level = "info";
    std::string data_file;  // empty: keep everything in memory
    TextEncoding default_encoding = TextEncoding::Auto;
};

// Reads a JSON config file; an empty path yields the defaults. Unknown keys
// are ignored, wrong types or values throw std::runtime_error.
ServerConfig load_config(const std::string& path);

// Applies TRADELOG_HOST, TRADELOG_PORT, TRADELOG_LOG_LEVEL and
// TRADELOG_DATA_FILE on top of `config`.
void apply_env_overrides(ServerConfig& config);

} // namespace tradelog
