#include "sync/delivery_pool.hpp"
#include <spdlog/spdlog.h>

namespace memsync::sync {

DeliveryPool::DeliveryPool(size_t worker_count) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    spdlog::debug("Delivery pool started with {} workers", worker_count);
}

DeliveryPool::~DeliveryPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<bool> DeliveryPool::submit(TaskFn task) {
    std::packaged_task<bool()> packaged(std::move(task));
    auto future = packaged.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!stopping_) {
            queue_.push_back(std::move(packaged));
            queue_cv_.notify_one();
            return future;
        }
    }

    spdlog::warn("Delivery pool is stopping, task rejected");
    std::promise<bool> rejected;
    rejected.set_value(false);
    return rejected.get_future();
}

size_t DeliveryPool::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void DeliveryPool::worker_loop() {
    while (true) {
        std::packaged_task<bool()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        task();
    }
}

} // namespace memsync::sync
