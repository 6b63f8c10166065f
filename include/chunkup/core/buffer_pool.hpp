/**
 * @file buffer_pool.hpp
 * @brief Recycling store of fixed-capacity byte buffers
 *
 * WHY THIS FILE EXISTS:
 * Every chunk in flight needs a chunk-sized buffer. Allocating one per chunk
 * churns the allocator for long streams; recycling them keeps the working
 * set at "buffers currently borrowed", which the hand-off queue bounds.
 *
 * OWNERSHIP:
 * A buffer is owned by exactly one party at a time: the idle list, the
 * producer filling it, or the upload task holding it. Ownership moves with
 * std::move; nothing here tracks individual buffers.
 *
 * EXAMPLE:
 * BufferPool pool(4 * 1024 * 1024);
 * auto buffer = pool.get();        // size() == buffer_capacity()
 * ... fill buffer[0, n) ...
 * pool.put(std::move(buffer));     // back to full size for the next get()
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace chunkup::core {

class BufferPool {
public:
    using Buffer = std::vector<std::uint8_t>;

    explicit BufferPool(std::size_t buffer_capacity);

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /**
     * @brief Borrow a buffer of buffer_capacity() bytes
     *
     * Recycled buffers are not cleared: bytes from an earlier chunk may still
     * be present past whatever length the caller writes.
     *
     * THREAD SAFE: Yes
     */
    Buffer get();

    /**
     * @brief Return a buffer, restoring it to full size
     *
     * Buffers shrunk by the borrower (e.g. a short tail chunk) are grown back
     * to buffer_capacity() before they are handed out again.
     *
     * THREAD SAFE: Yes
     */
    void put(Buffer buffer);

    std::size_t buffer_capacity() const noexcept { return buffer_capacity_; }

    std::size_t idle_count() const;
    std::size_t allocated_count() const;

    /// Buffers currently borrowed (get() calls not yet matched by put())
    std::size_t outstanding_count() const;

    /// Highest outstanding_count() observed since construction
    std::size_t peak_outstanding() const;

private:
    const std::size_t buffer_capacity_;

    mutable std::mutex mutex_;
    std::vector<Buffer> idle_;
    std::size_t allocated_ = 0;
    std::size_t outstanding_ = 0;
    std::size_t peak_outstanding_ = 0;
};

} // namespace chunkup::core
