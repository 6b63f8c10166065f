#include "chunkup/storage/chunk_naming.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>

namespace chunkup::storage {

std::string chunk_object_name(const std::string& key, std::uint64_t offset) {
    if (offset == 0) {
        return key;
    }
    std::ostringstream oss;
    oss << key << kChunkInfix << std::setw(kChunkOffsetWidth) << std::setfill('0') << offset;
    return oss.str();
}

std::optional<std::uint64_t> parse_chunk_offset(const std::string& key,
                                                const std::string& name) {
    if (name == key) {
        return 0;
    }

    const std::size_t infix_len = std::strlen(kChunkInfix);
    if (name.size() != key.size() + infix_len + kChunkOffsetWidth) {
        return std::nullopt;
    }
    if (name.compare(0, key.size(), key) != 0 ||
        name.compare(key.size(), infix_len, kChunkInfix) != 0) {
        return std::nullopt;
    }

    std::uint64_t offset = 0;
    for (std::size_t i = key.size() + infix_len; i < name.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(name[i]);
        if (!std::isdigit(c)) {
            return std::nullopt;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (offset > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        offset = offset * 10 + digit;
    }

    // "<key>.chunk-000...0" is never produced; offset 0 lives at the key
    if (offset == 0) {
        return std::nullopt;
    }
    return offset;
}

std::vector<ChunkObject> collect_chunk_objects(const std::string& key,
                                               const std::vector<ObjectInfo>& listing) {
    std::vector<ChunkObject> chunks;
    chunks.reserve(listing.size());
    for (const auto& object : listing) {
        if (auto offset = parse_chunk_offset(key, object.name)) {
            chunks.push_back(ChunkObject{*offset, object});
        }
    }

    std::sort(chunks.begin(), chunks.end(), [](const ChunkObject& a, const ChunkObject& b) {
        return a.offset < b.offset;
    });
    return chunks;
}

} // namespace chunkup::storage
