#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace tradelog {

// Returns the registered logger with this name, creating a colored stdout
// logger on first use. Safe to call from several instances of a component.
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

// Applies a level name ("trace" ... "off") to every logger; throws
// std::runtime_error for unknown names.
void set_log_level(const std::string& level);

} // namespace tradelog
