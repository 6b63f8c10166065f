#include "chunkup/core/buffer_pool.hpp"

#include <algorithm>

namespace chunkup::core {

BufferPool::BufferPool(std::size_t buffer_capacity)
    : buffer_capacity_(std::max<std::size_t>(buffer_capacity, 1)) {}

BufferPool::Buffer BufferPool::get() {
    {
        std::lock_guard lock(mutex_);
        ++outstanding_;
        peak_outstanding_ = std::max(peak_outstanding_, outstanding_);
        if (!idle_.empty()) {
            Buffer buffer = std::move(idle_.back());
            idle_.pop_back();
            return buffer;
        }
        ++allocated_;
    }
    // Allocate outside the lock
    return Buffer(buffer_capacity_);
}

void BufferPool::put(Buffer buffer) {
    if (buffer.size() != buffer_capacity_) {
        buffer.resize(buffer_capacity_);
    }

    std::lock_guard lock(mutex_);
    if (outstanding_ > 0) {
        --outstanding_;
    }
    idle_.push_back(std::move(buffer));
}

std::size_t BufferPool::idle_count() const {
    std::lock_guard lock(mutex_);
    return idle_.size();
}

std::size_t BufferPool::allocated_count() const {
    std::lock_guard lock(mutex_);
    return allocated_;
}

std::size_t BufferPool::outstanding_count() const {
    std::lock_guard lock(mutex_);
    return outstanding_;
}

std::size_t BufferPool::peak_outstanding() const {
    std::lock_guard lock(mutex_);
    return peak_outstanding_;
}

} // namespace chunkup::core
