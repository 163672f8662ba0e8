#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mediaseek {

// ============================================================================
// WorkerPool - fixed number of threads draining a job queue
// ============================================================================
//
// A pool of zero threads runs every job inline in post(), which keeps
// single-threaded callers (and tests) deterministic.

class WorkerPool {
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
    bool stopped_ = false;

    void worker_loop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                work_cv_.wait(lock, [this] { return stopped_ || !jobs_.empty(); });
                if (jobs_.empty()) {
                    return;     // stopped and drained
                }
                job = std::move(jobs_.front());
                jobs_.pop();
                ++active_;
            }

            job();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --active_;
            }
            idle_cv_.notify_all();
        }
    }

public:
    explicit WorkerPool(size_t thread_count) {
        workers_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~WorkerPool() {
        stop();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once the pool is stopped; the job is not run
    bool post(std::function<void()> job) {
        if (workers_.empty()) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopped_) return false;
            }
            job();
            return true;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) return false;
            jobs_.push(std::move(job));
        }
        work_cv_.notify_one();
        return true;
    }

    // Block until the queue is empty and no job is running
    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return jobs_.empty() && active_ == 0; });
    }

    // Queued jobs still run; new posts are refused. Joins the threads.
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_ && workers_.empty()) return;
            stopped_ = true;
        }
        work_cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    size_t thread_count() const noexcept { return workers_.size(); }
};

} // namespace mediaseek
