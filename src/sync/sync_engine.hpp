/**
 * memsync Synchronization Engine
 *
 * Owns the write path for memory entries shared between consumers:
 * - Storage (pluggable backend with a content-hash index)
 * - TokenBudgetManager (per-consumer ceilings)
 * - OperationQueue (pending deliveries, retried until acknowledged)
 * - AdapterRegistry + DeliveryPool (per-consumer delivery, one task per target)
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "memory/token_budget.hpp"
#include "memory/types.hpp"
#include "storage/memory_storage.hpp"
#include "sync/adapter_registry.hpp"
#include "sync/delivery_pool.hpp"
#include "sync/memory_status.hpp"
#include "sync/operation_queue.hpp"
#include "sync/sync_config.hpp"

namespace memsync::sync {

struct WriteResult {
    bool success = false;
    bool superseded = false;   // stale write: stored entry kept, version bumped
    std::string key;
    uint64_t version = 0;
};

class SyncEngine {
public:
    using Clock = std::function<memory::Timestamp()>;

    explicit SyncEngine(std::shared_ptr<storage::MemoryStorage> storage,
                        SyncConfig config = {},
                        Clock clock = {});
    ~SyncEngine();

    // Non-copyable
    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    // Initializes storage (fatal on failure) and every registered adapter
    bool initialize();

    // Also sets the consumer's ceiling: configured budget, else the
    // adapter's context window size
    bool register_adapter(std::shared_ptr<ToolAdapter> adapter);
    bool unregister_adapter(const std::string& tool);
    void set_token_budget(const std::string& tool, int64_t ceiling);

    // Stamps origin and now, version 1. Fails only if storage does.
    WriteResult create(const std::string& key, memory::MemoryEntry entry, const std::string& origin);

    // Absent (or expired) key degenerates to create. An entry carrying its
    // own last_modified is checked against the stored one: unless strictly
    // newer it is rejected, the stored entry is kept and its version bumped
    // (superseded). Without a timestamp the write is stamped now and wins.
    WriteResult update(const std::string& key, memory::MemoryEntry entry, const std::string& origin);

    // Expired entries read as absent. For a consumer other than the origin
    // the entry is compressed until it fits that consumer's remaining budget;
    // if nothing fits, the most compressed variant is returned.
    std::optional<memory::MemoryEntry> get(const std::string& key, const std::string& consumer);

    // False if the key was absent
    bool erase(const std::string& key, const std::string& origin);

    // Drains the queue once; returns the number of operations fully delivered
    size_t process_pending_operations();

    // Required keys first (in the order given), then everything else by
    // (priority, context_relevance) descending, admitted against the
    // consumer's budget. Replaces the consumer's previous window, so its
    // tokens are released first. admitted.size() is the window size.
    memory::OptimizationResult optimize_context_window(const std::string& tool,
                                                       const std::vector<std::string>& required_keys = {});

    MemoryStatus get_memory_status();

    // Removes expired entries, queuing their deletion; returns the count
    size_t purge_expired();

    // Explicitly gives up on deliveries for key, including ones in the
    // current drain (they are not retried); safe while a drain is blocked
    size_t abandon_pending(const std::string& key);

    // Most recent operations, oldest first; limit 0 returns the whole trail
    std::vector<SyncOperation> audit_log(size_t limit = 0) const;

    std::vector<SyncOperation> pending_operations() const { return queue_.snapshot(); }
    size_t pending_count() const { return queue_.size(); }

    memory::TokenBudgetManager& budgets() { return budgets_; }
    storage::MemoryStorage& storage() { return *storage_; }
    const SyncConfig& config() const { return config_; }

private:
    std::shared_ptr<storage::MemoryStorage> storage_;
    SyncConfig config_;
    Clock clock_;

    memory::TokenBudgetManager budgets_;
    AdapterRegistry registry_;
    OperationQueue queue_;

    // Serializes mutations (storage write + index + enqueue); readers share
    std::shared_mutex state_mutex_;
    // Single drainer
    std::mutex drain_mutex_;

    // Last context window admitted per consumer
    std::unordered_map<std::string, std::vector<memory::AdmittedEntry>> windows_;
    std::mutex window_mutex_;

    std::deque<SyncOperation> audit_;
    mutable std::mutex audit_mutex_;

    std::atomic<uint64_t> next_operation_id_{1};

    // Declared last: joins its workers before anything above is destroyed
    DeliveryPool pool_;

    WriteResult create_locked(const std::string& key, memory::MemoryEntry entry, const std::string& origin);
    void enqueue(SyncOperationType type, const std::string& key,
                 std::optional<memory::MemoryEntry> entry, const std::string& origin,
                 memory::MemoryType memory_type);
    void record_audit(const SyncOperation& op);
    bool deliver(const SyncOperation& op, ToolAdapter& adapter, const std::string& target);
    void mark_synced(const std::string& key, const std::string& tool, uint64_t version);
};

} // namespace memsync::sync
