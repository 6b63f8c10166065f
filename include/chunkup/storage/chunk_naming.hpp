#pragma once

#include "chunkup/storage/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkup::storage {

/**
 * Sub-object naming for one logical key:
 *
 *   offset 0  -> "<key>"
 *   offset N  -> "<key>.chunk-<N as 20 zero-padded digits>"
 *
 * The first chunk lands on the logical key itself, so a single-chunk write
 * needs no compose. Fixed-width offsets make lexicographic order equal offset
 * order, but callers still sort by the parsed offset.
 */
inline constexpr const char* kChunkInfix = ".chunk-";
inline constexpr std::size_t kChunkOffsetWidth = 20;

std::string chunk_object_name(const std::string& key, std::uint64_t offset);

/// Offset encoded in `name`, or nullopt if `name` is not a sub-object of `key`
std::optional<std::uint64_t> parse_chunk_offset(const std::string& key,
                                                const std::string& name);

/// Keep only sub-objects of `key` from a prefix listing, sorted by offset
std::vector<ChunkObject> collect_chunk_objects(const std::string& key,
                                               const std::vector<ObjectInfo>& listing);

} // namespace chunkup::storage
