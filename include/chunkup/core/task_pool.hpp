/**
 * @file task_pool.hpp
 * @brief Fixed-size worker pool fed through a bounded queue
 *
 * WHY THIS FILE EXISTS:
 * The upload path needs N long-lived workers, a shared queue, a "no more
 * work" signal and a join on shutdown. TaskPool packages that lifecycle so
 * callers only submit tasks and wait.
 *
 * LIFECYCLE:
 * - Constructor starts the workers immediately
 * - submit() blocks while the queue is full (back-pressure)
 * - wait_idle() blocks until every submitted task has finished
 * - shutdown() stops intake, lets workers drain the queue, joins them
 *
 * EXAMPLE:
 * TaskPool pool(4, 1);
 * pool.submit([] { upload_one(); });
 * pool.shutdown();  // all submitted tasks have run when this returns
 */

#pragma once

#include "chunkup/core/bounded_queue.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace chunkup::core {

class TaskPool {
public:
    using Task = std::function<void()>;

    TaskPool(std::size_t workers, std::size_t queue_depth);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /**
     * @brief Queue a task for execution on a worker
     *
     * RETURNS: false if the pool is shut down (task is not run)
     * BLOCKS: Yes, while the queue is full and every worker is busy
     */
    [[nodiscard]] bool submit(Task task);

    /**
     * @brief Wait until every task submitted so far has completed
     */
    void wait_idle();

    /**
     * @brief Stop accepting tasks, drain the queue and join the workers
     *
     * Idempotent. Must not be called from inside a task.
     */
    void shutdown();

    std::size_t worker_count() const noexcept { return worker_count_; }
    std::size_t queue_depth() const noexcept { return queue_.capacity(); }

    /// Tasks submitted but not yet finished (queued + running)
    std::size_t pending() const;

private:
    void worker_loop(std::size_t index);
    void finish_task();

    const std::size_t worker_count_;
    BoundedQueue<Task> queue_;
    std::vector<std::thread> workers_;

    mutable std::mutex pending_mutex_;
    std::condition_variable idle_cv_;
    std::size_t pending_ = 0;

    std::mutex shutdown_mutex_;
    bool joined_ = false;
};

} // namespace chunkup::core
