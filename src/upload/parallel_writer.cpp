#include "chunkup/upload/parallel_writer.hpp"

#include "chunkup/storage/chunk_naming.hpp"
#include "chunkup/storage/compose_request.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <exception>
#include <string>

namespace chunkup::upload {
namespace {

// Chunk payloads are streamed into targets in blocks of this size
constexpr std::size_t kStreamBlockSize = 256 * 1024;

} // namespace

ParallelWriter::ParallelWriter(storage::ObjectStore& store,
                               std::string key,
                               storage::ChunkTargetFactory factory,
                               const UploadConfig& config,
                               std::shared_ptr<core::BufferPool> pool)
    : store_(store),
      key_(std::move(key)),
      factory_(std::move(factory)),
      config_(config),
      buffer_pool_(pool ? std::move(pool) : std::make_shared<core::BufferPool>(config.chunk_size)),
      tasks_(config.workers, config.queue_depth) {
    if (auto valid = config_.validate(); valid.is_error()) {
        spdlog::warn("[Writer] key={} invalid config, using clamped values: {}", key_, valid.error().describe());
    }
    spdlog::debug("[Writer] key={} store={} chunk_size={} workers={} queue_depth={}",
                  key_, store_.type_name(), buffer_pool_->buffer_capacity(),
                  tasks_.worker_count(), tasks_.queue_depth());
}

ParallelWriter::ParallelWriter(storage::ObjectStore& store, std::string key, const UploadConfig& config)
    : ParallelWriter(store, key, storage::make_chunk_target_factory(store, key), config) {}

ParallelWriter::~ParallelWriter() {
    auto closed = close();
    if (closed.is_error()) {
        spdlog::warn("[Writer] key={} closed with error on destruction: {}", key_, closed.error().describe());
    } else if (lifecycle_.state() == WriterState::Closed && size() > 0) {
        spdlog::debug("[Writer] key={} destroyed without commit or cancel", key_);
    }
}

Result<std::size_t> ParallelWriter::write(const std::uint8_t* data, std::size_t size) {
    if (!lifecycle_.is_open()) {
        return Err<std::size_t>(ErrorCode::WriterClosed, "Wrote to closed writer: " + key_);
    }
    if (auto error = upload_error()) {
        return Err<std::size_t>(*error);
    }

    const std::size_t capacity = buffer_pool_->buffer_capacity();
    std::size_t n = 0;
    while (n < size) {
        if (!current_) {
            current_ = buffer_pool_->get();
            current_start_ = total_size_.load();
            current_length_ = 0;
        }

        const std::size_t count = std::min(size - n, capacity - current_length_);
        std::memcpy(current_->data() + current_length_, data + n, count);
        n += count;
        current_length_ += count;
        total_size_ += count;

        if (current_length_ == capacity) {
            Chunk chunk{current_start_, std::move(*current_), current_length_};
            current_.reset();
            current_length_ = 0;
            if (auto res = dispatch(std::move(chunk)); res.is_error()) {
                return Err<std::size_t>(res.error());
            }
        }
    }
    return Ok(n);
}

Result<std::size_t> ParallelWriter::write(const std::vector<std::uint8_t>& data) {
    return write(data.data(), data.size());
}

Result<void> ParallelWriter::close() {
    std::lock_guard lock(close_mutex_);
    if (lifecycle_.is_open()) {
        if (current_) {
            if (current_length_ > 0) {
                Chunk chunk{current_start_, std::move(*current_), current_length_};
                current_.reset();
                current_length_ = 0;
                if (auto res = dispatch(std::move(chunk)); res.is_error()) {
                    abort_upload(res.error());
                }
            } else {
                buffer_pool_->put(std::move(*current_));
                current_.reset();
            }
        }

        // No more chunks: workers drain the queue and exit
        tasks_.shutdown();
        if (auto moved = lifecycle_.transition_to(WriterState::Closed); moved.is_error()) {
            return moved;
        }
        spdlog::debug("[Closed] key={} bytes={} chunks_uploaded={} chunks_failed={}",
                      key_, size(), stats_.chunks_uploaded.load(), stats_.chunks_failed.load());
    }

    if (auto error = upload_error()) {
        // A chunk failed: nothing uploaded by this writer may survive
        if (auto cleanup = run_cleanup(); cleanup.is_error()) {
            spdlog::error("[Cleanup] key={} failed after upload error: {}", key_, cleanup.error().describe());
        }
        return Err<void>(*error);
    }
    return Ok();
}

Result<void> ParallelWriter::commit() {
    if (auto closed = close(); closed.is_error()) {
        return closed;
    }

    const auto state = lifecycle_.state();
    if (state == WriterState::Committed) {
        // Retry any sub-object deletes an earlier commit could not finish
        return remove_merged_chunks();
    }
    if (state == WriterState::Cancelled) {
        return Err<void>(ErrorCode::WriterCancelled, "Commit on cancelled writer: " + key_);
    }

    auto listed = list_chunks();
    if (listed.is_error()) {
        return Err<void>(listed.error());
    }
    const auto& chunks = listed.value();
    if (chunks.empty()) {
        return Err<void>(ErrorCode::NoObjects, "No objects found for " + key_);
    }
    if (auto covered = verify_coverage(chunks); covered.is_error()) {
        return covered;
    }

    // One sub-object already lives at the key
    if (chunks.size() > 1) {
        if (auto composed = compose_chunks(chunks); composed.is_error()) {
            return composed;
        }
    }

    if (auto moved = lifecycle_.transition_to(WriterState::Committed); moved.is_error()) {
        return moved;
    }
    spdlog::info("[Committed] key={} bytes={} chunks={} compose_calls={}",
                 key_, size(), chunks.size(), stats_.compose_calls.load());

    if (chunks.size() == 1) {
        return Ok();
    }
    return remove_merged_chunks();
}

Result<void> ParallelWriter::cancel() {
    if (auto closed = close(); closed.is_error()) {
        spdlog::debug("[Cancel] key={} close reported: {}", key_, closed.error().describe());
    }
    return run_cleanup();
}

Result<void> ParallelWriter::dispatch(Chunk chunk) {
    const auto offset = chunk.start_offset;
    spdlog::debug("[Chunk] key={} offset={} bytes={} queued", key_, offset, chunk.length);

    auto task = [this, chunk = std::move(chunk)]() mutable {
        upload_chunk(std::move(chunk));
    };
    if (!tasks_.submit(std::move(task))) {
        return Err<void>(ErrorCode::WriterClosed,
                         "Upload pool stopped before chunk at offset " + std::to_string(offset) + " of " + key_);
    }
    return Ok();
}

void ParallelWriter::upload_chunk(Chunk chunk) {
    if (aborted_.load()) {
        ++stats_.chunks_skipped;
        spdlog::debug("[Chunk] key={} offset={} skipped after abort", key_, chunk.start_offset);
        buffer_pool_->put(std::move(chunk.buffer));
        return;
    }

    auto result = upload_to_target(chunk);
    const auto offset = chunk.start_offset;
    const auto length = chunk.length;
    buffer_pool_->put(std::move(chunk.buffer));

    if (result.is_error()) {
        ++stats_.chunks_failed;
        abort_upload(result.error());
        return;
    }

    ++stats_.chunks_uploaded;
    stats_.bytes_uploaded += length;
    spdlog::debug("[ChunkUploaded] key={} offset={} bytes={}", key_, offset, length);
}

Result<void> ParallelWriter::upload_to_target(const Chunk& chunk) {
    const std::string where = key_ + " at offset " + std::to_string(chunk.start_offset);
    try {
        auto target = factory_(chunk.start_offset);
        if (target.is_error()) {
            return Err<void>(ErrorCode::UploadFailed,
                             "Failed to open chunk target for " + where + ": " + target.error().describe());
        }
        if (!target.value()) {
            return Err<void>(ErrorCode::UploadFailed, "No chunk target for " + where);
        }

        std::size_t written = 0;
        while (written < chunk.length) {
            const std::size_t block = std::min(kStreamBlockSize, chunk.length - written);
            auto res = target.value()->write(chunk.buffer.data() + written, block);
            if (res.is_error()) {
                return Err<void>(ErrorCode::UploadFailed,
                                 "Failed to stream chunk for " + where + ": " + res.error().describe());
            }
            written += block;
        }

        auto committed = target.value()->commit();
        if (committed.is_error()) {
            return Err<void>(ErrorCode::UploadFailed,
                             "Failed to commit chunk for " + where + ": " + committed.error().describe());
        }
    } catch (const std::exception& e) {
        return Err<void>(ErrorCode::UploadFailed, "Chunk upload threw for " + where + ": " + e.what());
    }
    return Ok();
}

void ParallelWriter::abort_upload(Error error) {
    {
        std::lock_guard lock(error_mutex_);
        if (!first_error_) {
            spdlog::warn("[UploadAborted] key={} error={}", key_, error.describe());
            first_error_ = std::move(error);
        }
    }
    aborted_.store(true);
}

std::optional<Error> ParallelWriter::upload_error() const {
    std::lock_guard lock(error_mutex_);
    return first_error_;
}

Result<std::vector<storage::ChunkObject>> ParallelWriter::list_chunks() const {
    auto listed = store_.list(key_);
    if (listed.is_error()) {
        return Err<std::vector<storage::ChunkObject>>(
            ErrorCode::ListFailed, "Failed to list sub-objects of " + key_ + ": " + listed.error().describe());
    }
    return Ok(storage::collect_chunk_objects(key_, listed.value()));
}

Result<void> ParallelWriter::verify_coverage(const std::vector<storage::ChunkObject>& chunks) const {
    std::uint64_t expected = 0;
    for (const auto& chunk : chunks) {
        if (chunk.offset != expected) {
            return Err<void>(ErrorCode::IncompleteUpload,
                             "Sub-objects of " + key_ + " have a gap at offset " + std::to_string(expected) +
                                 " (next chunk starts at " + std::to_string(chunk.offset) + ")");
        }
        expected += chunk.object.size;
    }
    if (expected != size()) {
        return Err<void>(ErrorCode::IncompleteUpload,
                         "Sub-objects of " + key_ + " hold " + std::to_string(expected) +
                             " bytes, writer accepted " + std::to_string(size()));
    }
    return Ok();
}

Result<void> ParallelWriter::compose_chunks(const std::vector<storage::ChunkObject>& chunks) {
    // Each round folds the current destination plus the next batch into it
    const std::size_t per_round = std::max<std::size_t>(config_.max_compose_sources, 2) - 1;

    storage::ObjectInfo composed = chunks.front().object;
    std::size_t next = 1;
    while (next < chunks.size()) {
        storage::ComposeRequest request;
        request.destination = key_;
        request.sources.push_back(storage::ComposeSource{composed.name, composed.generation});

        const std::size_t end = std::min(chunks.size(), next + per_round);
        for (; next < end; ++next) {
            request.sources.push_back(
                storage::ComposeSource{chunks[next].object.name, chunks[next].object.generation});
        }

        if (spdlog::default_logger_raw()->should_log(spdlog::level::debug)) {
            spdlog::debug("[Compose] key={} body={}", key_, storage::to_json_body(request));
        }

        auto result = store_.compose(request);
        ++stats_.compose_calls;
        if (result.is_error()) {
            spdlog::warn("[ComposeFailed] key={} sources={} error={}",
                         key_, request.sources.size(), result.error().describe());
            return Err<void>(result.error());
        }
        composed = result.value();
    }
    return Ok();
}

Result<void> ParallelWriter::delete_objects(const std::vector<storage::ObjectInfo>& objects) {
    std::optional<Error> first_failure;
    for (const auto& object : objects) {
        auto removed = store_.remove(object);
        if (removed.is_ok()) {
            ++stats_.objects_deleted;
            continue;
        }
        if (removed.error().code == ErrorCode::NotFound) {
            spdlog::debug("[Cleanup] key={} object={} already gone", key_, object.name);
            continue;
        }
        spdlog::warn("[Cleanup] key={} object={} delete failed: {}", key_, object.name, removed.error().describe());
        if (!first_failure) {
            first_failure = removed.error();
        }
    }

    if (first_failure) {
        return Err<void>(*first_failure);
    }
    return Ok();
}

Result<void> ParallelWriter::remove_merged_chunks() {
    auto listed = list_chunks();
    if (listed.is_error()) {
        return Err<void>(listed.error());
    }

    // The offset-0 object is the composed result; everything after it was merged into it
    std::vector<storage::ObjectInfo> merged;
    for (const auto& chunk : listed.value()) {
        if (chunk.offset > 0) {
            merged.push_back(chunk.object);
        }
    }
    return delete_objects(merged);
}

Result<void> ParallelWriter::run_cleanup() {
    std::lock_guard lock(cleanup_mutex_);
    if (cleanup_result_) {
        return *cleanup_result_;
    }
    if (auto moved = lifecycle_.transition_to(WriterState::Cancelled); moved.is_error()) {
        return moved;
    }

    Result<void> result;
    auto listed = list_chunks();
    if (listed.is_error()) {
        result = Err<void>(listed.error());
    } else {
        std::vector<storage::ObjectInfo> objects;
        objects.reserve(listed.value().size());
        for (const auto& chunk : listed.value()) {
            objects.push_back(chunk.object);
        }
        result = delete_objects(objects);
    }

    cleanup_result_ = result;
    spdlog::info("[Cancelled] key={} objects_deleted={} ok={}",
                 key_, stats_.objects_deleted.load(), result.is_ok());
    return result;
}

} // namespace chunkup::upload
