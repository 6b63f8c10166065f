#include "chunkup/core/task_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace chunkup::core {

TaskPool::TaskPool(std::size_t workers, std::size_t queue_depth)
    : worker_count_(std::max<std::size_t>(workers, 1)),
      queue_(queue_depth) {
    workers_.reserve(worker_count_);
    for (std::size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this, i]() { worker_loop(i); });
    }
    spdlog::debug("[TaskPool] started workers={} queue_depth={}", worker_count_, queue_.capacity());
}

TaskPool::~TaskPool() {
    shutdown();
}

bool TaskPool::submit(Task task) {
    {
        std::lock_guard lock(pending_mutex_);
        ++pending_;
    }

    if (!queue_.push(std::move(task))) {
        finish_task();
        return false;
    }
    return true;
}

void TaskPool::wait_idle() {
    std::unique_lock lock(pending_mutex_);
    idle_cv_.wait(lock, [this]() { return pending_ == 0; });
}

void TaskPool::shutdown() {
    std::lock_guard lock(shutdown_mutex_);
    if (joined_) {
        return;
    }

    // Workers keep popping until the queue is drained, then exit
    queue_.shutdown();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    joined_ = true;
    spdlog::debug("[TaskPool] stopped workers={}", worker_count_);
}

std::size_t TaskPool::pending() const {
    std::lock_guard lock(pending_mutex_);
    return pending_;
}

void TaskPool::worker_loop(std::size_t index) {
    while (auto task = queue_.pop()) {
        try {
            (*task)();
        } catch (const std::exception& e) {
            spdlog::error("[TaskPool] worker={} task threw: {}", index, e.what());
        }
        finish_task();
    }
}

void TaskPool::finish_task() {
    std::lock_guard lock(pending_mutex_);
    if (pending_ > 0) {
        --pending_;
    }
    if (pending_ == 0) {
        idle_cv_.notify_all();
    }
}

} // namespace chunkup::core
