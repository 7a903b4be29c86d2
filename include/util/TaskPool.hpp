#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace coda::util {

// Fixed pool of worker threads running detached fire-and-forget jobs
// (cover fetches, sample-rate switches). Jobs never report back through the
// pool; their only effects are their own side-channel writes.
class TaskPool {
public:
    using Job = std::function<void()>;

    // num_threads == 0 picks hardware_concurrency (fallback 4).
    // max_queue == 0 means unbounded.
    explicit TaskPool(size_t num_threads = 0, size_t max_queue = 0);

    // Destructor runs the jobs still queued, then joins the workers
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    // Returns false if the pool is stopping or the queue is full
    [[nodiscard]] bool submit(Job job);

    // Blocks until the queue is empty and no job is running
    void wait_idle();

    [[nodiscard]] size_t queue_size() const;
    [[nodiscard]] size_t thread_count() const { return workers_.size(); }

private:
    void worker_thread();

    std::vector<std::thread> workers_;

    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    size_t active_jobs_ = 0;

    std::atomic<bool> stop_{false};
    size_t max_queue_;
};

}  // namespace coda::util
