#pragma once
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "sync/sync_operation.hpp"

namespace memsync::sync {

// Multi-producer queue of pending deliveries. The single drainer takes the
// whole backlog at once and hands back whatever still has targets.
class OperationQueue {
public:
    void push(SyncOperation op);

    // Operations taken stay in flight until the matching requeue()
    std::vector<SyncOperation> take_all();

    // Ends a drain: puts failed operations back ahead of anything enqueued
    // meanwhile, except those whose key was removed while in flight.
    // Returns how many went back.
    size_t requeue(std::vector<SyncOperation> ops);

    // Drops every operation for key, queued or in flight; returns how many
    size_t remove_key(const std::string& key);

    std::vector<SyncOperation> snapshot() const;
    size_t size() const;

private:
    std::deque<SyncOperation> queue_;
    std::map<std::string, size_t> in_flight_;   // key -> operations taken
    std::set<std::string> abandoned_;
    mutable std::mutex mutex_;
};

} // namespace memsync::sync
