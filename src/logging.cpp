#include "tradelog/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <stdexcept>

namespace tradelog {

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
        logger->set_level(spdlog::get_level());
    }
    return logger;
}

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"; only accept that when asked for
    if (parsed == spdlog::level::off && level != "off") {
        throw std::runtime_error("Unknown log level: " + level);
    }
    spdlog::set_level(parsed);
}

} // namespace tradelog
