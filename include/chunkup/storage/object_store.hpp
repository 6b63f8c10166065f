#pragma once

/**
 * @file object_store.hpp
 * @brief Capabilities the upload engine needs from an object-store backend
 *
 * The engine never talks to a wire protocol. It needs four things:
 * - a writable target per chunk (streamed writes, explicit commit)
 * - prefix listing with generations
 * - delete by identity
 * - server-side compose of an ordered source list
 *
 * Implementations: MemoryObjectStore (in-process, fault injection) and
 * LocalObjectStore (directory on disk).
 */

#include "chunkup/core/result.hpp"
#include "chunkup/storage/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace chunkup::storage {

/**
 * @brief Destination for one chunk upload
 *
 * Nothing is visible in the store until commit() succeeds. Destroying a
 * target without committing discards what was written.
 */
class ChunkTarget {
public:
    virtual ~ChunkTarget() = default;

    virtual Result<void> write(const std::uint8_t* data, std::size_t size) = 0;

    // Publishes the object; returns its name, new generation and size
    virtual Result<ObjectInfo> commit() = 0;
};

/// Creates the write target for the chunk starting at the given stream offset
using ChunkTargetFactory =
    std::function<Result<std::unique_ptr<ChunkTarget>>(std::uint64_t offset)>;

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Backend name for logging
    virtual std::string type_name() const = 0;

    virtual Result<std::unique_ptr<ChunkTarget>> open_target(const std::string& name) = 0;

    // All objects whose name starts with prefix, in lexicographic name order
    virtual Result<std::vector<ObjectInfo>> list(const std::string& prefix) const = 0;

    // Deletes object.name; a non-zero object.generation must match the stored one
    virtual Result<void> remove(const ObjectInfo& object) = 0;

    virtual Result<ObjectInfo> compose(const ComposeRequest& request) = 0;

    virtual Result<std::vector<std::uint8_t>> get(const std::string& name) const = 0;
};

/**
 * @brief Bind a per-offset target factory to a store and logical key
 *
 * The chunk at offset N is written to chunk_object_name(key, N). The store
 * must outlive the returned factory.
 */
ChunkTargetFactory make_chunk_target_factory(ObjectStore& store, std::string key);

} // namespace chunkup::storage
