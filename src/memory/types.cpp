#include "memory/types.hpp"
#include "memory/content_hash.hpp"

using json = nlohmann::json;

namespace memsync::memory {

const char* memory_type_to_string(MemoryType type) {
    switch (type) {
        case MemoryType::SHARED:        return "shared";
        case MemoryType::TOOL_SPECIFIC: return "tool_specific";
        default: return "unknown";
    }
}

const char* memory_scope_to_string(MemoryScope scope) {
    switch (scope) {
        case MemoryScope::SESSION: return "session";
        case MemoryScope::GLOBAL:  return "global";
        default: return "unknown";
    }
}

const char* compression_level_to_string(CompressionLevel level) {
    switch (level) {
        case CompressionLevel::NONE:           return "none";
        case CompressionLevel::LIGHT:          return "light";
        case CompressionLevel::MEDIUM:         return "medium";
        case CompressionLevel::HIGH:           return "high";
        case CompressionLevel::EXTREME:        return "extreme";
        case CompressionLevel::REFERENCE_ONLY: return "reference_only";
        default: return "unknown";
    }
}

const char* storage_tier_to_string(StorageTier tier) {
    switch (tier) {
        case StorageTier::HOT:  return "hot";
        case StorageTier::WARM: return "warm";
        case StorageTier::COLD: return "cold";
        default: return "unknown";
    }
}

MemoryType memory_type_from_string(const std::string& str) {
    if (str == "tool_specific") return MemoryType::TOOL_SPECIFIC;
    return MemoryType::SHARED;
}

MemoryScope memory_scope_from_string(const std::string& str) {
    if (str == "global") return MemoryScope::GLOBAL;
    return MemoryScope::SESSION;
}

CompressionLevel compression_level_from_string(const std::string& str) {
    if (str == "light")          return CompressionLevel::LIGHT;
    if (str == "medium")         return CompressionLevel::MEDIUM;
    if (str == "high")           return CompressionLevel::HIGH;
    if (str == "extreme")        return CompressionLevel::EXTREME;
    if (str == "reference_only") return CompressionLevel::REFERENCE_ONLY;
    return CompressionLevel::NONE;
}

StorageTier storage_tier_from_string(const std::string& str) {
    if (str == "warm") return StorageTier::WARM;
    if (str == "cold") return StorageTier::COLD;
    return StorageTier::HOT;
}

int64_t to_millis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_millis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
}

json MemoryMetadata::to_json() const {
    json j;
    j["source_tool"] = source_tool;
    j["last_modified"] = to_millis(last_modified);
    j["access_count"] = access_count;
    j["last_accessed"] = to_millis(last_accessed);
    j["context_relevance"] = context_relevance;
    j["version"] = version;
    j["sync_status"] = sync_status;
    j["content_hash"] = content_hash;
    return j;
}

MemoryMetadata MemoryMetadata::from_json(const json& j) {
    MemoryMetadata meta;
    meta.source_tool = j.value("source_tool", "");
    meta.last_modified = from_millis(j.value("last_modified", int64_t{0}));
    meta.access_count = j.value("access_count", uint64_t{0});
    meta.last_accessed = from_millis(j.value("last_accessed", int64_t{0}));
    meta.context_relevance = j.value("context_relevance", 0.0);
    meta.version = j.value("version", uint64_t{1});
    if (j.contains("sync_status") && j["sync_status"].is_object()) {
        for (const auto& [tool, version] : j["sync_status"].items()) {
            meta.sync_status[tool] = version.get<uint64_t>();
        }
    }
    meta.content_hash = j.value("content_hash", "");
    return meta;
}

void MemoryEntry::refresh_content_hash() {
    metadata.content_hash = content_hash(content);
}

json MemoryEntry::to_json() const {
    json j;
    j["memory_type"] = memory_type_to_string(memory_type);
    j["scope"] = memory_scope_to_string(scope);
    j["priority"] = priority;
    j["compression_level"] = compression_level_to_string(compression_level);
    j["ttl_seconds"] = ttl_seconds;
    j["content"] = content;
    j["metadata"] = metadata.to_json();
    j["storage_tier"] = storage_tier_to_string(storage_tier);
    return j;
}

MemoryEntry MemoryEntry::from_json(const json& j) {
    MemoryEntry entry;
    entry.memory_type = memory_type_from_string(j.value("memory_type", "shared"));
    entry.scope = memory_scope_from_string(j.value("scope", "session"));
    entry.priority = j.value("priority", 0);
    entry.compression_level = compression_level_from_string(j.value("compression_level", "none"));
    entry.ttl_seconds = j.value("ttl_seconds", int64_t{0});
    entry.content = j.value("content", json{});
    if (j.contains("metadata") && j["metadata"].is_object()) {
        entry.metadata = MemoryMetadata::from_json(j["metadata"]);
    }
    entry.storage_tier = storage_tier_from_string(j.value("storage_tier", "hot"));
    return entry;
}

} // namespace memsync::memory
