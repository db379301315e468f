#include "sync/sync_worker.hpp"
#include "sync/sync_engine.hpp"
#include <spdlog/spdlog.h>

namespace memsync::sync {

SyncWorker::SyncWorker(SyncEngine& engine, std::chrono::milliseconds interval)
    : engine_(engine), interval_(interval) {}

SyncWorker::~SyncWorker() {
    stop();
}

void SyncWorker::start() {
    if (running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        woken_ = false;
    }
    running_ = true;
    thread_ = std::thread([this]() { run(); });
    spdlog::info("Sync worker started (interval {} ms)", interval_.count());
}

void SyncWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        spdlog::info("Sync worker stopped after {} cycles", cycles_.load());
    }
    running_ = false;
}

void SyncWorker::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        woken_ = true;
    }
    cv_.notify_all();
}

void SyncWorker::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval_, [this]() { return stopping_ || woken_; });
            if (stopping_) {
                return;
            }
            woken_ = false;
        }

        try {
            size_t delivered = engine_.process_pending_operations();
            if (delivered > 0) {
                spdlog::debug("Sync worker delivered {} operation(s)", delivered);
            }
        } catch (const std::exception& e) {
            spdlog::error("Sync worker drain failed: {}", e.what());
        }
        cycles_++;
    }
}

} // namespace memsync::sync
