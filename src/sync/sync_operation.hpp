#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "memory/types.hpp"

namespace memsync::sync {

enum class SyncOperationType {
    CREATED,
    UPDATED,
    DELETED,
    ACCESSED    // audit only, never delivered
};

inline std::string sync_operation_type_to_string(SyncOperationType type) {
    switch (type) {
        case SyncOperationType::CREATED:  return "CREATED";
        case SyncOperationType::UPDATED:  return "UPDATED";
        case SyncOperationType::DELETED:  return "DELETED";
        case SyncOperationType::ACCESSED: return "ACCESSED";
        default: return "UNKNOWN";
    }
}

// A mutation awaiting delivery. `targets` shrinks as consumers acknowledge;
// the operation leaves the queue once it is empty.
struct SyncOperation {
    uint64_t id = 0;
    SyncOperationType type = SyncOperationType::ACCESSED;
    std::string key;
    std::optional<memory::MemoryEntry> entry;
    std::string origin;
    std::vector<std::string> targets;
    memory::Timestamp created_at{};
    uint32_t attempts = 0;

    bool needs_delivery() const {
        return type != SyncOperationType::ACCESSED && !targets.empty();
    }

    nlohmann::json to_json() const;
};

} // namespace memsync::sync
