#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace memsync::sync {

// Engine configuration
struct SyncConfig {
    size_t delivery_workers = 4;                    // Adapter call threads
    size_t audit_capacity = 1000;                   // Operations kept in the audit trail
    std::chrono::milliseconds drain_interval{1000}; // SyncWorker period
    std::string log_level = "info";
    std::map<std::string, int64_t> tool_budgets;    // Overrides adapter window sizes

    nlohmann::json to_json() const;
};

// Parses "roo=8000,cline=16000"; malformed pairs are skipped
std::map<std::string, int64_t> parse_tool_budgets(const std::string& list);

// Reads MEMSYNC_* variables (after load_dotenv) over the defaults
SyncConfig load_sync_config();

} // namespace memsync::sync
