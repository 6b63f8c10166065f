#include "chunkup/storage/object_store.hpp"

#include "chunkup/storage/chunk_naming.hpp"

#include <utility>

namespace chunkup::storage {

ChunkTargetFactory make_chunk_target_factory(ObjectStore& store, std::string key) {
    return [&store, key = std::move(key)](std::uint64_t offset) {
        return store.open_target(chunk_object_name(key, offset));
    };
}

} // namespace chunkup::storage
