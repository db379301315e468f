#include "sync/memory_status.hpp"

namespace memsync::sync {

nlohmann::json MemoryStatus::to_json() const {
    nlohmann::json j;
    j["status"] = status;
    j["entry_count"] = entry_count;
    j["expired_count"] = expired_count;
    j["tool_counts"] = tool_counts;
    j["scope_counts"] = scope_counts;
    j["type_counts"] = type_counts;
    j["compression_counts"] = compression_counts;
    j["token_usage"] = token_usage;
    j["pending_operations"] = pending_operations;
    j["storage"] = storage;
    j["tools"] = tools;
    return j;
}

} // namespace memsync::sync
