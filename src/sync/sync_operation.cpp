#include "sync/sync_operation.hpp"

namespace memsync::sync {

nlohmann::json SyncOperation::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["type"] = sync_operation_type_to_string(type);
    j["key"] = key;
    j["origin"] = origin;
    j["targets"] = targets;
    j["created_at"] = memory::to_millis(created_at);
    j["attempts"] = attempts;
    if (entry) {
        j["version"] = entry->metadata.version;
    }
    return j;
}

} // namespace memsync::sync
