#include "util/TaskPool.hpp"
#include "util/Logger.hpp"
#include <exception>

namespace coda::util {

TaskPool::TaskPool(size_t num_threads, size_t max_queue) : max_queue_(max_queue) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }

    Logger::info("TaskPool: Starting " + std::to_string(num_threads) + " worker threads");

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() {
            worker_thread();
        });
    }
}

TaskPool::~TaskPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    Logger::debug("TaskPool: Shutdown complete");
}

bool TaskPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return false;
        }
        if (max_queue_ > 0 && job_queue_.size() >= max_queue_) {
            Logger::debug("TaskPool: Queue full (" + std::to_string(job_queue_.size()) +
                          " jobs), rejecting job");
            return false;
        }
        job_queue_.push(std::move(job));
    }

    cv_.notify_one();
    return true;
}

void TaskPool::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]() {
        return job_queue_.empty() && active_jobs_ == 0;
    });
}

size_t TaskPool::queue_size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return job_queue_.size();
}

void TaskPool::worker_thread() {
    while (true) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this]() {
                return stop_ || !job_queue_.empty();
            });

            if (stop_ && job_queue_.empty()) {
                break;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop();
            ++active_jobs_;
        }

        // Jobs handle their own failures; anything escaping is a bug in the job
        try {
            job();
        } catch (const std::exception& e) {
            Logger::error(std::string("TaskPool: Job threw: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_jobs_;
            if (job_queue_.empty() && active_jobs_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

}  // namespace coda::util
