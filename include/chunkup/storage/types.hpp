#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chunkup::storage {

/**
 * @brief Identity of a stored object as returned by a listing
 *
 * generation changes every time the object at `name` is replaced, so
 * (name, generation) names one exact version.
 */
struct ObjectInfo {
    std::string name;
    std::int64_t generation = 0;
    std::uint64_t size = 0;
};

/**
 * @brief One input of a server-side compose
 *
 * generation == 0 means "whatever version is current"; any other value is a
 * precondition the store must check.
 */
struct ComposeSource {
    std::string name;
    std::int64_t generation = 0;
};

/**
 * @brief Merge `sources`, in order, into the object named `destination`
 */
struct ComposeRequest {
    std::string destination;
    std::vector<ComposeSource> sources;
};

/**
 * @brief A sub-object belonging to one logical write, with its stream offset
 */
struct ChunkObject {
    std::uint64_t offset = 0;
    ObjectInfo object;
};

} // namespace chunkup::storage
