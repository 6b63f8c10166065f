#include "chunkup/storage/chunk_naming.hpp"

#include <gtest/gtest.h>

using chunkup::storage::ObjectInfo;
using chunkup::storage::chunk_object_name;
using chunkup::storage::collect_chunk_objects;
using chunkup::storage::parse_chunk_offset;

TEST(ChunkNamingTest, FirstChunkUsesTheKey) {
    EXPECT_EQ(chunk_object_name("docs/a.bin", 0), "docs/a.bin");
}

TEST(ChunkNamingTest, LaterChunksUseFixedWidthOffsets) {
    EXPECT_EQ(chunk_object_name("a", 4), "a.chunk-00000000000000000004");
    EXPECT_EQ(chunk_object_name("a", 1234567890), "a.chunk-00000000001234567890");

    // Lexicographic order follows numeric order
    EXPECT_LT(chunk_object_name("a", 8), chunk_object_name("a", 16));
    EXPECT_LT(chunk_object_name("a", 999), chunk_object_name("a", 1000));
}

TEST(ChunkNamingTest, ParseRecoversOffset) {
    EXPECT_EQ(parse_chunk_offset("a", "a"), 0u);
    EXPECT_EQ(parse_chunk_offset("a", chunk_object_name("a", 4096)), 4096u);
}

TEST(ChunkNamingTest, ParseRejectsForeignNames) {
    EXPECT_FALSE(parse_chunk_offset("a", "ab").has_value());
    EXPECT_FALSE(parse_chunk_offset("a", "a.chunk-12").has_value());
    EXPECT_FALSE(parse_chunk_offset("a", "a.chunk-0000000000000000000x").has_value());
    EXPECT_FALSE(parse_chunk_offset("a", "a.chunk-00000000000000000000").has_value());
    EXPECT_FALSE(parse_chunk_offset("a", "a.chunk-99999999999999999999").has_value());
    EXPECT_FALSE(parse_chunk_offset("a", chunk_object_name("b", 4)).has_value());
}

TEST(ChunkNamingTest, CollectFiltersAndSortsByOffset) {
    std::vector<ObjectInfo> listing{
        {chunk_object_name("k", 8), 3, 2},
        {"kx", 9, 5},
        {"k", 1, 4},
        {chunk_object_name("k", 4), 2, 4},
    };

    auto chunks = collect_chunk_objects("k", listing);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].offset, 0u);
    EXPECT_EQ(chunks[0].object.name, "k");
    EXPECT_EQ(chunks[1].offset, 4u);
    EXPECT_EQ(chunks[1].object.generation, 2);
    EXPECT_EQ(chunks[2].offset, 8u);
    EXPECT_EQ(chunks[2].object.size, 2u);
}
