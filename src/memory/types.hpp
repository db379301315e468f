#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace memsync::memory {

using Timestamp = std::chrono::system_clock::time_point;

// Whether an entry is shared with every consumer or private to its origin
enum class MemoryType {
    SHARED,
    TOOL_SPECIFIC
};

// Lifetime class
enum class MemoryScope {
    SESSION,
    GLOBAL
};

// Compression ladder, ordered from verbatim to pointer-only
enum class CompressionLevel {
    NONE,
    LIGHT,
    MEDIUM,
    HIGH,
    EXTREME,
    REFERENCE_ONLY
};

// Placement hint for eviction tooling (informational only)
enum class StorageTier {
    HOT,
    WARM,
    COLD
};

const char* memory_type_to_string(MemoryType type);
const char* memory_scope_to_string(MemoryScope scope);
const char* compression_level_to_string(CompressionLevel level);
const char* storage_tier_to_string(StorageTier tier);

MemoryType memory_type_from_string(const std::string& str);
MemoryScope memory_scope_from_string(const std::string& str);
CompressionLevel compression_level_from_string(const std::string& str);
StorageTier storage_tier_from_string(const std::string& str);

int64_t to_millis(Timestamp ts);
Timestamp from_millis(int64_t millis);

struct MemoryMetadata {
    std::string source_tool;
    Timestamp last_modified{};
    uint64_t access_count = 0;
    Timestamp last_accessed{};
    double context_relevance = 0.0;
    uint64_t version = 1;
    std::map<std::string, uint64_t> sync_status;  // consumer -> last synced version
    std::string content_hash;

    nlohmann::json to_json() const;
    static MemoryMetadata from_json(const nlohmann::json& j);
};

// One unit of memory. Content is either a string or an object.
struct MemoryEntry {
    MemoryType memory_type = MemoryType::SHARED;
    MemoryScope scope = MemoryScope::SESSION;
    int priority = 0;
    CompressionLevel compression_level = CompressionLevel::NONE;
    int64_t ttl_seconds = 0;  // 0 = never expires
    nlohmann::json content;
    MemoryMetadata metadata;
    StorageTier storage_tier = StorageTier::HOT;

    // Expired once more than ttl_seconds have passed since last_modified
    bool is_expired(Timestamp now) const {
        if (ttl_seconds <= 0) return false;
        return (now - metadata.last_modified) > std::chrono::seconds(ttl_seconds);
    }

    void record_access(Timestamp now) {
        metadata.access_count++;
        metadata.last_accessed = now;
    }

    void refresh_content_hash();

    nlohmann::json to_json() const;
    static MemoryEntry from_json(const nlohmann::json& j);
};

} // namespace memsync::memory
