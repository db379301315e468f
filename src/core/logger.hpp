#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace memsync::core {

// Initialize logging with console output (idempotent)
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// "trace".."critical"/"off"; unknown names map to info
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace memsync::core
