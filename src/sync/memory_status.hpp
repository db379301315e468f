#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace memsync::sync {

// Read-only snapshot for dashboards. Enum-keyed counts use the lower-case
// enum names.
struct MemoryStatus {
    std::string status = "healthy";     // storage health
    size_t entry_count = 0;
    size_t expired_count = 0;           // stored but past TTL, not yet purged
    std::map<std::string, size_t> tool_counts;
    std::map<std::string, size_t> scope_counts;
    std::map<std::string, size_t> type_counts;
    std::map<std::string, size_t> compression_counts;
    std::map<std::string, int64_t> token_usage;
    size_t pending_operations = 0;
    nlohmann::json storage;
    nlohmann::json tools = nlohmann::json::object();

    nlohmann::json to_json() const;
};

} // namespace memsync::sync
