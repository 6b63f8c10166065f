/**
 * @file bounded_queue.hpp
 * @brief Capacity-limited blocking queue used as the chunk hand-off channel
 *
 * WHY THIS FILE EXISTS:
 * The producer (a writer filling buffers) must not run arbitrarily far ahead
 * of the uploaders. A queue with a small fixed capacity makes push() block
 * once every slot is taken, which is the only back-pressure the upload path
 * needs to keep memory bounded.
 *
 * EXAMPLE:
 * BoundedQueue<Chunk> queue(1);
 * queue.push(std::move(chunk));  // Producer, blocks while full
 * auto next = queue.pop();       // Consumer, blocks while empty
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace chunkup::core {

/**
 * @brief Thread-safe FIFO queue with a fixed capacity
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - push() waits on not_full_, pop() waits on not_empty_
 *
 * SHUTDOWN:
 * After shutdown() push() refuses new items, while pop() keeps handing out
 * what is already queued and returns nullopt once the queue is drained.
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    // Non-copyable
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Push item, waiting for a free slot
     *
     * RETURNS: false if the queue was shut down (item is dropped)
     * THREAD SAFE: Yes
     * BLOCKS: Yes, while the queue is full
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return queue_.size() < capacity_ || shutdown_;
            });

            if (shutdown_) {
                return false;
            }

            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Try to pop item (non-blocking)
     *
     * RETURNS: Item if available, nullopt if queue empty
     */
    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take(lock);
    }

    /**
     * @brief Pop item (blocking)
     *
     * RETURNS: Item, or nullopt once shut down and drained
     * BLOCKS: Yes, until item available or shutdown
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this]() {
            return !queue_.empty() || shutdown_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }
        return take(lock);
    }

    /**
     * @brief Pop item with timeout
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || shutdown_;
        })) {
            return std::nullopt;  // Timeout
        }

        if (queue_.empty()) {
            return std::nullopt;
        }
        return take(lock);
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    size_t capacity() const noexcept { return capacity_; }

    bool is_shutdown() const {
        std::unique_lock lock(mutex_);
        return shutdown_;
    }

    /**
     * @brief Signal shutdown (wake up all waiting producers and consumers)
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

private:
    // Caller holds the lock and has checked the queue is not empty
    std::optional<T> take(std::unique_lock<std::mutex>& lock) {
        T item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool shutdown_ = false;
};

} // namespace chunkup::core
