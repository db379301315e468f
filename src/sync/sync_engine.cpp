#include "sync/sync_engine.hpp"
#include <algorithm>
#include <iterator>
#include <limits>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

using namespace memsync::memory;

namespace memsync::sync {

SyncEngine::SyncEngine(std::shared_ptr<storage::MemoryStorage> storage,
                       SyncConfig config,
                       Clock clock)
    : storage_(std::move(storage)),
      config_(std::move(config)),
      clock_(std::move(clock)),
      budgets_(config_.tool_budgets),
      pool_(config_.delivery_workers) {
    if (!storage_) {
        throw std::invalid_argument("SyncEngine requires a storage backend");
    }
    if (!clock_) {
        clock_ = []() { return std::chrono::system_clock::now(); };
    }
    spdlog::debug("SyncEngine created ({} delivery workers)", config_.delivery_workers);
}

SyncEngine::~SyncEngine() {
    size_t pending = queue_.size();
    if (pending > 0) {
        spdlog::warn("SyncEngine shutting down with {} undelivered operations", pending);
    }
}

bool SyncEngine::initialize() {
    spdlog::info("Initializing sync engine");

    if (!storage_->initialize()) {
        spdlog::error("Failed to initialize storage");
        return false;
    }

    for (const auto& adapter : registry_.adapters()) {
        try {
            if (!adapter->initialize()) {
                spdlog::warn("Failed to initialize tool adapter: {}", adapter->tool_name());
            }
        } catch (const std::exception& e) {
            spdlog::error("Error initializing tool adapter {}: {}", adapter->tool_name(), e.what());
        }
    }

    spdlog::info("Sync engine initialized");
    return true;
}

bool SyncEngine::register_adapter(std::shared_ptr<ToolAdapter> adapter) {
    if (!adapter) {
        return false;
    }

    std::string name = adapter->tool_name();
    int64_t window = adapter->context_window_size();
    if (!registry_.register_adapter(std::move(adapter))) {
        return false;
    }

    auto configured = config_.tool_budgets.find(name);
    budgets_.set_budget(name, configured != config_.tool_budgets.end() ? configured->second : window);
    return true;
}

bool SyncEngine::unregister_adapter(const std::string& tool) {
    bool removed = registry_.unregister_adapter(tool);
    if (removed) {
        spdlog::info("Unregistered tool adapter: {}", tool);
    }
    return removed;
}

void SyncEngine::set_token_budget(const std::string& tool, int64_t ceiling) {
    budgets_.set_budget(tool, ceiling);
}

WriteResult SyncEngine::create(const std::string& key, MemoryEntry entry, const std::string& origin) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return create_locked(key, std::move(entry), origin);
}

WriteResult SyncEngine::create_locked(const std::string& key, MemoryEntry entry, const std::string& origin) {
    WriteResult result;
    result.key = key;

    entry.metadata.source_tool = origin;
    entry.metadata.last_modified = clock_();
    entry.metadata.version = 1;
    entry.metadata.sync_status.clear();
    entry.refresh_content_hash();

    if (!storage_->save(key, entry)) {
        spdlog::error("Failed to save memory entry: {}", key);
        return result;
    }

    spdlog::info("Created memory entry: {} from {}", key, origin);
    MemoryType type = entry.memory_type;
    enqueue(SyncOperationType::CREATED, key, std::move(entry), origin, type);

    result.success = true;
    result.version = 1;
    return result;
}

WriteResult SyncEngine::update(const std::string& key, MemoryEntry entry, const std::string& origin) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);

    auto now = clock_();
    auto existing = storage_->peek(key);
    if (!existing || existing->is_expired(now)) {
        spdlog::info("Memory entry not found for update, creating new: {}", key);
        return create_locked(key, std::move(entry), origin);
    }

    WriteResult result;
    result.key = key;

    Timestamp incoming = entry.metadata.last_modified;
    if (incoming != Timestamp{} && incoming <= existing->metadata.last_modified) {
        existing->metadata.version += 1;
        if (!storage_->save(key, *existing)) {
            spdlog::error("Failed to record conflict on memory entry: {}", key);
            return result;
        }

        spdlog::warn("Stale write to {} from {} rejected ({} <= {} ms), version now {}",
                     key, origin, to_millis(incoming), to_millis(existing->metadata.last_modified),
                     existing->metadata.version);
        result.success = true;
        result.superseded = true;
        result.version = existing->metadata.version;
        return result;
    }

    entry.metadata.source_tool = origin;
    entry.metadata.last_modified = (incoming != Timestamp{}) ? incoming : now;
    entry.metadata.version = existing->metadata.version + 1;
    entry.metadata.sync_status = existing->metadata.sync_status;
    entry.refresh_content_hash();

    if (!storage_->save(key, entry)) {
        spdlog::error("Failed to update memory entry: {}", key);
        return result;
    }

    spdlog::info("Updated memory entry: {} from {} (version {})", key, origin, entry.metadata.version);
    result.success = true;
    result.version = entry.metadata.version;

    MemoryType type = entry.memory_type;
    enqueue(SyncOperationType::UPDATED, key, std::move(entry), origin, type);
    return result;
}

std::optional<MemoryEntry> SyncEngine::get(const std::string& key, const std::string& consumer) {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);

    SyncOperation access;
    access.id = next_operation_id_.fetch_add(1, std::memory_order_relaxed);
    access.type = SyncOperationType::ACCESSED;
    access.key = key;
    access.origin = consumer;
    access.created_at = clock_();
    record_audit(access);

    auto stored = storage_->peek(key);
    if (!stored || stored->is_expired(access.created_at)) {
        spdlog::debug("Memory entry not found: {}", key);
        return std::nullopt;
    }

    auto entry = storage_->get(key);
    if (!entry) {
        return std::nullopt;
    }

    if (consumer != entry->metadata.source_tool && budgets_.has_budget(consumer) &&
        !budgets_.can_fit(*entry, consumer)) {
        auto fit = TokenBudgetManager::fit_to_budget(*entry, budgets_.available(consumer));
        if (!fit.fits) {
            spdlog::debug("Memory entry {} exceeds {}'s budget at every level, returning {}",
                          key, consumer, compression_level_to_string(fit.entry.compression_level));
        } else {
            spdlog::debug("Compressed memory entry {} for {} ({})",
                          key, consumer, compression_level_to_string(fit.entry.compression_level));
        }
        return fit.entry;
    }

    spdlog::debug("Retrieved memory entry: {} for {}", key, consumer);
    return entry;
}

bool SyncEngine::erase(const std::string& key, const std::string& origin) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);

    auto existing = storage_->peek(key);
    if (!existing) {
        spdlog::debug("Memory entry not found for deletion: {}", key);
        return false;
    }

    if (!storage_->erase(key)) {
        spdlog::error("Failed to delete memory entry: {}", key);
        return false;
    }

    spdlog::info("Deleted memory entry: {} from {}", key, origin);
    enqueue(SyncOperationType::DELETED, key, std::nullopt, origin, existing->memory_type);
    return true;
}

size_t SyncEngine::process_pending_operations() {
    std::lock_guard<std::mutex> drain_lock(drain_mutex_);

    auto ops = queue_.take_all();
    if (ops.empty()) {
        return 0;
    }

    struct Dispatch {
        std::string target;
        std::future<bool> result;
    };

    // (key, target) pairs with an earlier failure this round; later
    // operations for them wait so deliveries stay in order
    std::set<std::pair<std::string, std::string>> blocked;
    std::vector<SyncOperation> retry;
    size_t delivered = 0;

    for (auto& op : ops) {
        op.attempts++;
        std::vector<std::string> failed;
        std::vector<Dispatch> dispatches;

        for (const auto& target : op.targets) {
            if (blocked.count({op.key, target})) {
                failed.push_back(target);
                continue;
            }

            auto adapter = registry_.find(target);
            if (!adapter) {
                spdlog::warn("No adapter registered for {}, operation {} on {} stays queued",
                             target, op.id, op.key);
                failed.push_back(target);
                continue;
            }

            dispatches.push_back(Dispatch{target, pool_.submit([this, &op, adapter, target]() {
                return deliver(op, *adapter, target);
            })});
        }

        for (auto& dispatch : dispatches) {
            bool ok = false;
            try {
                ok = dispatch.result.get();
            } catch (const std::exception& e) {
                spdlog::error("Error syncing {} to {}: {}", op.key, dispatch.target, e.what());
            }

            if (!ok) {
                spdlog::warn("Failed to sync {} {} to {} (attempt {})",
                             sync_operation_type_to_string(op.type), op.key, dispatch.target, op.attempts);
                failed.push_back(dispatch.target);
                continue;
            }

            if (op.entry) {
                try {
                    mark_synced(op.key, dispatch.target, op.entry->metadata.version);
                } catch (const std::exception& e) {
                    spdlog::error("Failed to record sync status of {} for {}: {}",
                                  op.key, dispatch.target, e.what());
                }
            }
        }

        for (const auto& target : failed) {
            blocked.insert({op.key, target});
        }

        if (failed.empty()) {
            spdlog::debug("Operation {} ({} {}) delivered", op.id,
                          sync_operation_type_to_string(op.type), op.key);
            delivered++;
        } else {
            op.targets = std::move(failed);
            retry.push_back(std::move(op));
        }
    }

    size_t failed_ops = retry.size();
    size_t requeued = queue_.requeue(std::move(retry));
    if (requeued > 0) {
        spdlog::info("{} operation(s) remain pending for retry", requeued);
    }
    if (requeued < failed_ops) {
        spdlog::info("{} failed operation(s) were abandoned during the drain", failed_ops - requeued);
    }
    return delivered;
}

bool SyncEngine::deliver(const SyncOperation& op, ToolAdapter& adapter, const std::string& target) {
    if (op.type == SyncOperationType::DELETED) {
        return adapter.sync_delete(op.key);
    }

    if (!op.entry) {
        return false;
    }

    int64_t budget = budgets_.has_budget(target)
        ? budgets_.available(target)
        : std::numeric_limits<int64_t>::max();

    auto fit = TokenBudgetManager::fit_to_budget(*op.entry, budget);
    if (!fit.fits) {
        spdlog::warn("Entry {} does not fit {}'s budget at any compression level", op.key, target);
        return false;
    }

    if (op.type == SyncOperationType::CREATED) {
        return adapter.sync_create(op.key, fit.entry);
    }
    return adapter.sync_update(op.key, fit.entry);
}

void SyncEngine::mark_synced(const std::string& key, const std::string& tool, uint64_t version) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    auto stored = storage_->peek(key);
    if (!stored || stored->metadata.version != version) {
        return;
    }

    stored->metadata.sync_status[tool] = version;
    if (!storage_->save(key, *stored)) {
        spdlog::warn("Failed to record sync status of {} for {}", key, tool);
    }
}

OptimizationResult SyncEngine::optimize_context_window(const std::string& tool,
                                                       const std::vector<std::string>& required_keys) {
    if (!budgets_.has_budget(tool)) {
        spdlog::error("No token budget for {}, cannot optimize its context window", tool);
        return {};
    }

    std::vector<KeyedEntry> required;
    std::vector<KeyedEntry> others;
    std::set<std::string> required_set;
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        auto now = clock_();

        for (const auto& key : required_keys) {
            if (!required_set.insert(key).second) continue;
            auto entry = storage_->peek(key);
            if (entry && !entry->is_expired(now)) {
                required.push_back(KeyedEntry{key, std::move(*entry)});
            }
        }

        for (const auto& key : storage_->list_keys()) {
            if (required_set.count(key)) continue;
            auto entry = storage_->peek(key);
            if (entry && !entry->is_expired(now)) {
                others.push_back(KeyedEntry{key, std::move(*entry)});
            }
        }
    }

    std::stable_sort(others.begin(), others.end(), [](const KeyedEntry& a, const KeyedEntry& b) {
        if (a.entry.priority != b.entry.priority) {
            return a.entry.priority > b.entry.priority;
        }
        return a.entry.metadata.context_relevance > b.entry.metadata.context_relevance;
    });

    std::vector<KeyedEntry> ordered = std::move(required);
    ordered.insert(ordered.end(), std::make_move_iterator(others.begin()),
                   std::make_move_iterator(others.end()));

    // The window replaces the consumer's previous one; only its own entries
    // count against the budget
    std::lock_guard<std::mutex> window_lock(window_mutex_);
    auto previous = windows_.find(tool);
    if (previous != windows_.end()) {
        for (const auto& admitted : previous->second) {
            budgets_.release(admitted.entry, tool);
        }
        windows_.erase(previous);
    }

    auto result = budgets_.admit_in_order(ordered, tool);
    windows_[tool] = result.admitted;
    for (const auto& key : result.dropped) {
        if (required_set.count(key)) {
            spdlog::warn("Required entry {} does not fit {}'s context window", key, tool);
        }
    }

    spdlog::info("Optimized context window for {}: {} entries ({} tokens), {} dropped",
                 tool, result.admitted.size(), result.tokens_admitted, result.dropped.size());
    return result;
}

MemoryStatus SyncEngine::get_memory_status() {
    MemoryStatus status;

    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    auto now = clock_();

    status.storage = storage_->health_check();
    status.status = status.storage.value("status", "unhealthy") == "healthy" ? "healthy" : "unhealthy";

    for (const auto& key : storage_->list_keys()) {
        auto entry = storage_->peek(key);
        if (!entry) continue;

        status.entry_count++;
        if (entry->is_expired(now)) status.expired_count++;

        status.tool_counts[entry->metadata.source_tool]++;
        status.scope_counts[memory_scope_to_string(entry->scope)]++;
        status.type_counts[memory_type_to_string(entry->memory_type)]++;
        status.compression_counts[compression_level_to_string(entry->compression_level)]++;
    }

    status.token_usage = budgets_.usage_snapshot();
    status.pending_operations = queue_.size();

    for (const auto& adapter : registry_.adapters()) {
        std::string name = adapter->tool_name();
        try {
            status.tools[name] = adapter->status();
        } catch (const std::exception& e) {
            spdlog::error("Error getting status for tool {}: {}", name, e.what());
            status.tools[name] = {{"status", "error"}, {"error", e.what()}};
        }
    }

    return status;
}

size_t SyncEngine::purge_expired() {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    auto now = clock_();

    size_t purged = 0;
    for (const auto& key : storage_->list_keys()) {
        auto entry = storage_->peek(key);
        if (!entry || !entry->is_expired(now)) continue;

        if (!storage_->erase(key)) {
            spdlog::error("Failed to purge expired memory entry: {}", key);
            continue;
        }
        enqueue(SyncOperationType::DELETED, key, std::nullopt, entry->metadata.source_tool,
                entry->memory_type);
        purged++;
    }

    if (purged > 0) {
        spdlog::info("Purged {} expired memory entries", purged);
    }
    return purged;
}

size_t SyncEngine::abandon_pending(const std::string& key) {
    // Runs without drain_mutex_; operations for key in the current drain
    // are dropped when it requeues
    size_t removed = queue_.remove_key(key);
    if (removed > 0) {
        spdlog::warn("Abandoned {} pending operation(s) for {}", removed, key);
    }
    return removed;
}

std::vector<SyncOperation> SyncEngine::audit_log(size_t limit) const {
    std::lock_guard<std::mutex> lock(audit_mutex_);
    size_t count = (limit == 0 || limit > audit_.size()) ? audit_.size() : limit;
    return std::vector<SyncOperation>(audit_.end() - static_cast<std::ptrdiff_t>(count), audit_.end());
}

void SyncEngine::enqueue(SyncOperationType type, const std::string& key,
                         std::optional<MemoryEntry> entry, const std::string& origin,
                         MemoryType memory_type) {
    SyncOperation op;
    op.id = next_operation_id_.fetch_add(1, std::memory_order_relaxed);
    op.type = type;
    op.key = key;
    op.entry = std::move(entry);
    op.origin = origin;
    op.created_at = clock_();
    if (memory_type == MemoryType::SHARED) {
        op.targets = registry_.targets_for(origin);
    }

    record_audit(op);

    if (!op.needs_delivery()) {
        spdlog::debug("Operation {} on {} has no delivery targets", op.id, key);
        return;
    }
    queue_.push(std::move(op));
}

void SyncEngine::record_audit(const SyncOperation& op) {
    spdlog::debug("{} {} by {}", sync_operation_type_to_string(op.type), op.key, op.origin);

    if (config_.audit_capacity == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(audit_mutex_);
    SyncOperation record = op;
    record.entry.reset();
    audit_.push_back(std::move(record));
    while (audit_.size() > config_.audit_capacity) {
        audit_.pop_front();
    }
}

} // namespace memsync::sync
