#include "storage/in_memory_storage.hpp"
#include <algorithm>

namespace memsync::storage {

InMemoryStorage::InMemoryStorage()
    : clock_([]() { return std::chrono::system_clock::now(); }) {}

InMemoryStorage::InMemoryStorage(Clock clock)
    : clock_(std::move(clock)) {}

bool InMemoryStorage::save(const std::string& key, const memory::MemoryEntry& entry) {
    if (key.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        unindex(key, it->second.metadata.content_hash);
    }

    entries_[key] = entry;
    if (!entry.metadata.content_hash.empty()) {
        hash_index_[entry.metadata.content_hash].insert(key);
    }
    return true;
}

std::optional<memory::MemoryEntry> InMemoryStorage::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    it->second.record_access(clock_());
    return it->second;
}

std::optional<memory::MemoryEntry> InMemoryStorage::peek(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryStorage::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }

    unindex(key, it->second.metadata.content_hash);
    entries_.erase(it);
    return true;
}

std::vector<std::string> InMemoryStorage::list_keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> keys;
    for (const auto& [key, entry] : entries_) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(key);
        }
    }

    std::sort(keys.begin(), keys.end());
    return keys;
}

std::optional<memory::MemoryEntry> InMemoryStorage::get_by_hash(const std::string& content_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hash_index_.find(content_hash);
    if (it == hash_index_.end() || it->second.empty()) {
        return std::nullopt;
    }

    auto entry_it = entries_.find(*it->second.begin());
    if (entry_it == entries_.end()) {
        return std::nullopt;
    }
    return entry_it->second;
}

nlohmann::json InMemoryStorage::health_check() {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json health;
    health["status"] = "healthy";
    health["backend"] = "in_memory";
    health["entries"] = entries_.size();
    health["indexed_hashes"] = hash_index_.size();
    return health;
}

size_t InMemoryStorage::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void InMemoryStorage::unindex(const std::string& key, const std::string& content_hash) {
    auto it = hash_index_.find(content_hash);
    if (it == hash_index_.end()) {
        return;
    }

    it->second.erase(key);
    if (it->second.empty()) {
        hash_index_.erase(it);
    }
}

} // namespace memsync::storage
