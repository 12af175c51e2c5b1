/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool with cooperative cancellation.
 *
 * Serves HTTP connections: each job receives the worker's stop_token, so a
 * shutdown reaches long-running executions through the same token the
 * gateway uses for cancellation.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace sandbox_gate {

class ThreadPool {
public:
    using Job = std::function<void(std::stop_token)>;

    /**
     * @param num_threads  0 = hardware concurrency
     * @param max_queued   0 = unbounded; try_post fails once this many jobs wait
     */
    explicit ThreadPool(size_t num_threads = 0, size_t max_queued = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Enqueue a fire-and-forget job; false when the queue is full or stopping.
    [[nodiscard]] bool try_post(Job job);

    /// Stop accepting work, signal running jobs and join the workers.
    void shutdown();

    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    size_t max_queued_;
    std::vector<std::jthread> workers_;
    std::queue<Job> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<bool> stopping_{false};
};

}  // namespace sandbox_gate
