#include "core/logger.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace memsync::core {

void init_logger() {
    static std::once_flag once;
    std::call_once(once, []() {
        auto logger = spdlog::stderr_color_mt("memsync");
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    });
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace memsync::core
