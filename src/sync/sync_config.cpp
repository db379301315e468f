#include "sync/sync_config.hpp"
#include "core/config.hpp"
#include <sstream>
#include <spdlog/spdlog.h>

namespace memsync::sync {

nlohmann::json SyncConfig::to_json() const {
    nlohmann::json j;
    j["delivery_workers"] = delivery_workers;
    j["audit_capacity"] = audit_capacity;
    j["drain_interval_ms"] = drain_interval.count();
    j["log_level"] = log_level;
    j["tool_budgets"] = tool_budgets;
    return j;
}

std::map<std::string, int64_t> parse_tool_budgets(const std::string& list) {
    std::map<std::string, int64_t> budgets;
    std::stringstream ss(list);
    std::string pair;
    while (std::getline(ss, pair, ',')) {
        if (pair.find_first_not_of(" \t") == std::string::npos) continue;

        size_t eq_pos = pair.find('=');
        if (eq_pos == std::string::npos) {
            spdlog::warn("Skipping malformed tool budget '{}'", pair);
            continue;
        }

        std::string tool = pair.substr(0, eq_pos);
        std::string value = pair.substr(eq_pos + 1);
        tool.erase(0, tool.find_first_not_of(" \t"));
        tool.erase(tool.find_last_not_of(" \t") + 1);

        try {
            size_t consumed = 0;
            int64_t ceiling = std::stoll(value, &consumed);
            if (tool.empty() || ceiling < 0 ||
                value.find_first_not_of(" \t", consumed) != std::string::npos) {
                spdlog::warn("Skipping malformed tool budget '{}'", pair);
                continue;
            }
            budgets[tool] = ceiling;
        } catch (const std::exception&) {
            spdlog::warn("Skipping malformed tool budget '{}'", pair);
        }
    }
    return budgets;
}

SyncConfig load_sync_config() {
    namespace config = core::config;

    SyncConfig cfg;
    int64_t workers = config::get_env_int("MEMSYNC_DELIVERY_WORKERS",
                                          static_cast<int64_t>(cfg.delivery_workers));
    if (workers > 0) cfg.delivery_workers = static_cast<size_t>(workers);

    int64_t capacity = config::get_env_int("MEMSYNC_AUDIT_CAPACITY",
                                           static_cast<int64_t>(cfg.audit_capacity));
    if (capacity >= 0) cfg.audit_capacity = static_cast<size_t>(capacity);

    int64_t interval = config::get_env_int("MEMSYNC_DRAIN_INTERVAL_MS", cfg.drain_interval.count());
    if (interval > 0) cfg.drain_interval = std::chrono::milliseconds(interval);

    cfg.log_level = config::get_env_or("MEMSYNC_LOG_LEVEL", cfg.log_level);
    cfg.tool_budgets = parse_tool_budgets(config::get_env("MEMSYNC_TOOL_BUDGETS"));
    return cfg;
}

} // namespace memsync::sync
