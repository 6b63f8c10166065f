#include "chunkup/storage/local_object_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;
using chunkup::ErrorCode;
using chunkup::storage::ComposeRequest;
using chunkup::storage::ComposeSource;
using chunkup::storage::LocalObjectStore;
using chunkup::storage::ObjectInfo;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("chunkup_local_store_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

ObjectInfo put(LocalObjectStore& store, const std::string& name, const std::string& data) {
    auto target = store.open_target(name);
    EXPECT_TRUE(target.is_ok());
    EXPECT_TRUE(target.value()->write(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()).is_ok());
    auto committed = target.value()->commit();
    EXPECT_TRUE(committed.is_ok());
    return committed.value();
}

std::string read(const LocalObjectStore& store, const std::string& name) {
    auto data = store.get(name);
    return data.is_ok() ? std::string(data.value().begin(), data.value().end()) : std::string("<missing>");
}

} // namespace

TEST(LocalObjectStoreTest, CommitMovesStagedFileIntoPlace) {
    const auto root = create_temp_dir();
    LocalObjectStore store(root);

    auto target = store.open_target("dir/obj.bin");
    ASSERT_TRUE(target.is_ok());
    const std::string payload = "payload";
    ASSERT_TRUE(target.value()->write(reinterpret_cast<const std::uint8_t*>(payload.data()), payload.size()).is_ok());
    EXPECT_FALSE(fs::exists(root / "dir" / "obj.bin"));

    auto committed = target.value()->commit();
    ASSERT_TRUE(committed.is_ok());
    EXPECT_EQ(committed.value().size, payload.size());
    EXPECT_TRUE(fs::exists(root / "dir" / "obj.bin"));
    EXPECT_EQ(read(store, "dir/obj.bin"), "payload");
}

TEST(LocalObjectStoreTest, AbandonedTargetLeavesNothingBehind) {
    const auto root = create_temp_dir();
    LocalObjectStore store(root);
    {
        auto target = store.open_target("ghost");
        ASSERT_TRUE(target.is_ok());
        const std::uint8_t byte = 7;
        ASSERT_TRUE(target.value()->write(&byte, 1).is_ok());
    }

    auto listed = store.list("");
    ASSERT_TRUE(listed.is_ok());
    EXPECT_TRUE(listed.value().empty());
    EXPECT_TRUE(fs::is_empty(root / LocalObjectStore::kStagingDirName));
}

TEST(LocalObjectStoreTest, ListSkipsStagingAndSortsNames) {
    const auto root = create_temp_dir();
    LocalObjectStore store(root);
    put(store, "k.chunk-00000000000000000008", "IJ");
    put(store, "k", "ABCD");
    put(store, "other", "x");

    auto listed = store.list("k");
    ASSERT_TRUE(listed.is_ok());
    ASSERT_EQ(listed.value().size(), 2u);
    EXPECT_EQ(listed.value()[0].name, "k");
    EXPECT_EQ(listed.value()[0].size, 4u);
    EXPECT_EQ(listed.value()[1].name, "k.chunk-00000000000000000008");
    EXPECT_GT(listed.value()[0].generation, 0);
}

TEST(LocalObjectStoreTest, ComposeIntoOneOfItsSources) {
    const auto root = create_temp_dir();
    LocalObjectStore store(root);
    auto head = put(store, "k", "ABCD");
    auto tail = put(store, "k.part", "EF");

    auto composed = store.compose(ComposeRequest{"k", {ComposeSource{"k", head.generation},
                                                       ComposeSource{"k.part", tail.generation}}});
    ASSERT_TRUE(composed.is_ok());
    EXPECT_EQ(composed.value().size, 6u);
    EXPECT_NE(composed.value().generation, head.generation);
    EXPECT_EQ(read(store, "k"), "ABCDEF");
}

TEST(LocalObjectStoreTest, ComposeRejectsStaleGeneration) {
    const auto root = create_temp_dir();
    LocalObjectStore store(root);
    auto old = put(store, "k", "v1");
    put(store, "k", "v2");

    auto composed = store.compose(ComposeRequest{"out", {ComposeSource{"k", old.generation}}});
    ASSERT_TRUE(composed.is_error());
    EXPECT_EQ(composed.error().code, ErrorCode::PreconditionFailed);
    EXPECT_FALSE(fs::exists(root / "out"));
}

TEST(LocalObjectStoreTest, RemoveChecksExistence) {
    const auto root = create_temp_dir();
    LocalObjectStore store(root);
    auto obj = put(store, "gone", "x");

    EXPECT_TRUE(store.remove(obj).is_ok());
    EXPECT_FALSE(fs::exists(root / "gone"));

    auto again = store.remove(obj);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

TEST(LocalObjectStoreTest, RejectsEscapingNames) {
    const auto root = create_temp_dir();
    LocalObjectStore store(root);

    EXPECT_EQ(store.open_target("../escape").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store.open_target("/abs").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store.open_target("").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store.open_target(".staging/x").error().code, ErrorCode::InvalidArgument);
}

TEST(LocalObjectStoreTest, PreexistingFilesAreListed) {
    const auto root = create_temp_dir();
    {
        std::ofstream out(root / "legacy.bin", std::ios::binary);
        out << "old";
    }
    LocalObjectStore store(root);

    auto listed = store.list("legacy");
    ASSERT_TRUE(listed.is_ok());
    ASSERT_EQ(listed.value().size(), 1u);
    EXPECT_EQ(listed.value()[0].generation, 1);
    EXPECT_TRUE(store.remove(listed.value()[0]).is_ok());
}

TEST(LocalObjectStoreTest, UnusableRootReportsErrorsInsteadOfThrowing) {
    const auto dir = create_temp_dir();
    const auto root = dir / "not_a_directory";
    std::ofstream(root) << "file";

    std::unique_ptr<LocalObjectStore> store;
    ASSERT_NO_THROW(store = std::make_unique<LocalObjectStore>(root));

    auto target = store->open_target("obj");
    ASSERT_TRUE(target.is_error());
    EXPECT_EQ(target.error().code, ErrorCode::IoError);

    auto listed = store->list("");
    ASSERT_TRUE(listed.is_error());
    EXPECT_EQ(listed.error().code, ErrorCode::ListFailed);

    ComposeRequest request;
    request.destination = "obj";
    request.sources.push_back(ComposeSource{"a", 0});
    std::optional<chunkup::Result<ObjectInfo>> composed;
    ASSERT_NO_THROW(composed = store->compose(request));
    ASSERT_TRUE(composed->is_error());

    auto removed = store->remove(ObjectInfo{"a", 0, 0});
    ASSERT_TRUE(removed.is_error());
    EXPECT_EQ(removed.error().code, ErrorCode::NotFound);
}
