#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "memory/types.hpp"

namespace memsync::sync {

// Delivers synchronized entries into one consumer's context. Entries arrive
// already compressed to fit the consumer's budget.
class ToolAdapter {
public:
    virtual ~ToolAdapter() = default;

    virtual std::string tool_name() const = 0;
    virtual int64_t context_window_size() const = 0;

    virtual bool initialize() { return true; }

    virtual bool sync_create(const std::string& key, const memory::MemoryEntry& entry) = 0;
    virtual bool sync_update(const std::string& key, const memory::MemoryEntry& entry) = 0;
    virtual bool sync_delete(const std::string& key) = 0;

    virtual nlohmann::json status() const {
        return {{"status", "ok"}};
    }
};

} // namespace memsync::sync
