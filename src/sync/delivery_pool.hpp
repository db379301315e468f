#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace memsync::sync {

// Fixed pool that runs adapter calls so one slow consumer does not hold up
// delivery to the others.
class DeliveryPool {
public:
    using TaskFn = std::function<bool()>;

    explicit DeliveryPool(size_t worker_count = 4);
    ~DeliveryPool();

    DeliveryPool(const DeliveryPool&) = delete;
    DeliveryPool& operator=(const DeliveryPool&) = delete;

    // Exceptions thrown by the task surface from future::get()
    std::future<bool> submit(TaskFn task);

    size_t worker_count() const { return workers_.size(); }
    size_t pending() const;

private:
    void worker_loop();

    std::deque<std::packaged_task<bool()>> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stopping_{false};
};

} // namespace memsync::sync
