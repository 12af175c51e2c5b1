/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

namespace sandbox_gate {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queued)
    : max_queued_(max_queued) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    stopping_.store(true);
    // Request stop on all jthreads first
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    // Wake all threads so they can observe the stop request
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

bool ThreadPool::try_post(Job job) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stopping_.load()) return false;
        if (max_queued_ != 0 && task_queue_.size() >= max_queued_) return false;
        task_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
    return true;
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        Job task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            if (stop.stop_requested() && task_queue_.empty()) return;
            if (task_queue_.empty()) continue;

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        task(stop);
    }
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace sandbox_gate
