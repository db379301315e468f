#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace memsync::sync {

class SyncEngine;

// Background drainer: calls process_pending_operations() every interval,
// or sooner when woken. Stops on destruction.
class SyncWorker {
public:
    SyncWorker(SyncEngine& engine, std::chrono::milliseconds interval);
    ~SyncWorker();

    SyncWorker(const SyncWorker&) = delete;
    SyncWorker& operator=(const SyncWorker&) = delete;

    void start();
    void stop();
    void wake();

    bool is_running() const { return running_; }
    uint64_t cycles() const { return cycles_; }

private:
    void run();

    SyncEngine& engine_;
    std::chrono::milliseconds interval_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    bool woken_ = false;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycles_{0};
};

} // namespace memsync::sync
