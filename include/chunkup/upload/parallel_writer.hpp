#pragma once

/**
 * @file parallel_writer.hpp
 * @brief Streams one logical object into a store as parallel chunk uploads
 *
 * FLOW:
 * write() slices the stream into chunk_size pieces, each tagged with its
 * start offset, and hands them to a TaskPool whose workers upload every piece
 * to its own sub-object. close() flushes the short tail and waits for the
 * workers. commit() lists the sub-objects, orders them by offset and composes
 * them into the logical key; cancel() deletes them instead.
 *
 * FAILURE:
 * A failed chunk upload is never retried. It aborts the whole write: later
 * write() calls fail, queued chunks are skipped, and once close() has drained
 * the workers every sub-object is deleted.
 *
 * THREADING:
 * write()/close()/commit()/cancel() are driven by one producer thread.
 * size(), state() and stats() may be read from any thread.
 */

#include "chunkup/core/buffer_pool.hpp"
#include "chunkup/core/result.hpp"
#include "chunkup/core/task_pool.hpp"
#include "chunkup/storage/object_store.hpp"
#include "chunkup/upload/config.hpp"
#include "chunkup/upload/lifecycle.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkup::upload {

/**
 * @brief One contiguous byte range of the stream
 *
 * Only buffer[0, length) is payload; the rest is pool capacity.
 */
struct Chunk {
    std::uint64_t start_offset = 0;
    core::BufferPool::Buffer buffer;
    std::size_t length = 0;
};

struct WriterStats {
    std::atomic<std::uint64_t> chunks_uploaded{0};
    std::atomic<std::uint64_t> bytes_uploaded{0};
    std::atomic<std::uint64_t> chunks_failed{0};
    std::atomic<std::uint64_t> chunks_skipped{0};
    std::atomic<std::uint64_t> compose_calls{0};
    std::atomic<std::uint64_t> objects_deleted{0};
};

class ParallelWriter {
public:
    /**
     * @param store   listing, compose and delete backend
     * @param key     logical object name
     * @param factory per-offset chunk target factory
     * @param config  validated upload tuning
     * @param pool    shared buffer pool; its buffer capacity is the chunk size.
     *                A private pool of config.chunk_size is created when null.
     */
    ParallelWriter(storage::ObjectStore& store,
                   std::string key,
                   storage::ChunkTargetFactory factory,
                   const UploadConfig& config,
                   std::shared_ptr<core::BufferPool> pool = nullptr);

    // Chunks go to chunk_object_name(key, offset) in `store`
    ParallelWriter(storage::ObjectStore& store, std::string key, const UploadConfig& config);

    ~ParallelWriter();

    ParallelWriter(const ParallelWriter&) = delete;
    ParallelWriter& operator=(const ParallelWriter&) = delete;

    /**
     * @brief Accept bytes into the stream
     *
     * Blocks while the hand-off queue is full. Returns `size` on success.
     * Fails with WriterClosed after close(), or with the recorded upload
     * error once a chunk upload has failed.
     */
    Result<std::size_t> write(const std::uint8_t* data, std::size_t size);
    Result<std::size_t> write(const std::vector<std::uint8_t>& data);

    /**
     * @brief Flush the tail chunk and wait for every upload to finish
     *
     * Idempotent. Returns the first upload error if any chunk failed.
     */
    Result<void> close();

    /**
     * @brief Merge the uploaded sub-objects into the logical key
     *
     * Closes first. A single sub-object is already the final object and is
     * left as is. After a successful compose the merged sub-objects are
     * deleted; if that fails the writer is still Committed and the error is
     * returned. Calling commit() again retries the deletes. Do not cancel()
     * a Committed writer to recover: that deletes the composed object.
     */
    Result<void> commit();

    /**
     * @brief Delete every sub-object of the key
     *
     * Closes first. The deletion pass runs once; later calls return its result.
     */
    Result<void> cancel();

    [[nodiscard]] std::uint64_t size() const noexcept { return total_size_.load(); }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] WriterState state() const { return lifecycle_.state(); }
    [[nodiscard]] const WriterStats& stats() const noexcept { return stats_; }
    [[nodiscard]] std::size_t chunk_size() const noexcept { return buffer_pool_->buffer_capacity(); }

private:
    Result<void> dispatch(Chunk chunk);
    void upload_chunk(Chunk chunk);
    Result<void> upload_to_target(const Chunk& chunk);
    void abort_upload(Error error);
    std::optional<Error> upload_error() const;

    Result<std::vector<storage::ChunkObject>> list_chunks() const;
    Result<void> verify_coverage(const std::vector<storage::ChunkObject>& chunks) const;
    Result<void> compose_chunks(const std::vector<storage::ChunkObject>& chunks);
    Result<void> delete_objects(const std::vector<storage::ObjectInfo>& objects);
    Result<void> remove_merged_chunks();
    Result<void> run_cleanup();

    storage::ObjectStore& store_;
    std::string key_;
    storage::ChunkTargetFactory factory_;
    UploadConfig config_;
    std::shared_ptr<core::BufferPool> buffer_pool_;

    UploadLifecycle lifecycle_;
    WriterStats stats_;
    std::atomic<std::uint64_t> total_size_{0};

    // Producer-side chunk in progress
    std::optional<core::BufferPool::Buffer> current_;
    std::uint64_t current_start_ = 0;
    std::size_t current_length_ = 0;

    std::atomic<bool> aborted_{false};
    mutable std::mutex error_mutex_;
    std::optional<Error> first_error_;

    std::mutex close_mutex_;
    std::mutex cleanup_mutex_;
    std::optional<Result<void>> cleanup_result_;

    // Last member: workers are joined before anything they touch is destroyed
    core::TaskPool tasks_;
};

} // namespace chunkup::upload
