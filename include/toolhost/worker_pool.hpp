#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace toolhost {

/// Fixed-size pool running tool handlers off the read loop.
/// Tasks queued before stop() are still run.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Throws std::runtime_error once the pool is stopped.
    void post(std::function<void()> task);

    /// Drain the queue and join all workers. Idempotent.
    void stop();

    [[nodiscard]] size_t size() const { return threads_.size(); }

private:
    void run();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{true};
};

} // namespace toolhost
