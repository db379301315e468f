#pragma once
#include <functional>
#include <mutex>
#include <set>
#include <unordered_map>
#include "storage/memory_storage.hpp"

namespace memsync::storage {

// Reference backend: one map for entries, one for hash -> keys
class InMemoryStorage : public MemoryStorage {
public:
    using Clock = std::function<memory::Timestamp()>;

    InMemoryStorage();
    explicit InMemoryStorage(Clock clock);

    bool save(const std::string& key, const memory::MemoryEntry& entry) override;
    std::optional<memory::MemoryEntry> get(const std::string& key) override;
    std::optional<memory::MemoryEntry> peek(const std::string& key) override;
    bool erase(const std::string& key) override;
    std::vector<std::string> list_keys(const std::string& prefix = "") override;
    std::optional<memory::MemoryEntry> get_by_hash(const std::string& content_hash) override;
    nlohmann::json health_check() override;

    size_t size();

private:
    std::unordered_map<std::string, memory::MemoryEntry> entries_;
    std::unordered_map<std::string, std::set<std::string>> hash_index_;
    std::mutex mutex_;
    Clock clock_;

    void unindex(const std::string& key, const std::string& content_hash);
};

} // namespace memsync::storage
