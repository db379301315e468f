#include "sync/operation_queue.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

namespace memsync::sync {

void OperationQueue::push(SyncOperation op) {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("Operation {} {} queued for {} target(s)",
                  op.id, sync_operation_type_to_string(op.type), op.targets.size());
    queue_.push_back(std::move(op));
}

std::vector<SyncOperation> OperationQueue::take_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SyncOperation> ops(std::make_move_iterator(queue_.begin()),
                                   std::make_move_iterator(queue_.end()));
    queue_.clear();

    in_flight_.clear();
    abandoned_.clear();
    for (const auto& op : ops) {
        in_flight_[op.key]++;
    }
    return ops;
}

size_t OperationQueue::requeue(std::vector<SyncOperation> ops) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t requeued = 0;
    for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
        if (abandoned_.count(it->key)) {
            continue;
        }
        queue_.push_front(std::move(*it));
        requeued++;
    }

    in_flight_.clear();
    abandoned_.clear();
    return requeued;
}

size_t OperationQueue::remove_key(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t before = queue_.size();
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                [&key](const SyncOperation& op) { return op.key == key; }),
                 queue_.end());
    size_t removed = before - queue_.size();

    auto it = in_flight_.find(key);
    if (it != in_flight_.end()) {
        removed += it->second;
        in_flight_.erase(it);
        abandoned_.insert(key);
    }
    return removed;
}

std::vector<SyncOperation> OperationQueue::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<SyncOperation>(queue_.begin(), queue_.end());
}

size_t OperationQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace memsync::sync
