#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "memory/types.hpp"

namespace memsync::storage {

// Backend I/O failure on a read path
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Key -> entry persistence with a content-hash secondary index.
 *
 * Implementations must be safe for concurrent use and must update the hash
 * index in the same critical section as the primary record, so that
 * get_by_hash never returns a missing or stale entry.
 */
class MemoryStorage {
public:
    virtual ~MemoryStorage() = default;

    virtual bool initialize() { return true; }

    virtual bool save(const std::string& key, const memory::MemoryEntry& entry) = 0;

    // Records the access on the stored entry
    virtual std::optional<memory::MemoryEntry> get(const std::string& key) = 0;

    // Plain read, no access bookkeeping
    virtual std::optional<memory::MemoryEntry> peek(const std::string& key) = 0;

    virtual bool erase(const std::string& key) = 0;
    virtual std::vector<std::string> list_keys(const std::string& prefix = "") = 0;
    virtual std::optional<memory::MemoryEntry> get_by_hash(const std::string& content_hash) = 0;

    // {"status": "healthy"|"unhealthy", ...backend detail}
    virtual nlohmann::json health_check() = 0;
};

} // namespace memsync::storage
