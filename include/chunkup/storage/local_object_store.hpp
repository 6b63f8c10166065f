#pragma once

#include "chunkup/storage/object_store.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>

namespace chunkup::storage {

/**
 * @brief Object store backed by a directory tree
 *
 * Object "a/b.bin" lives at <root>/a/b.bin. Targets stream into a file under
 * <root>/.staging and are renamed into place on commit, so readers never see
 * a half-written object. Compose concatenates its sources into a staging file
 * and renames it over the destination.
 *
 * Generations are tracked in memory for the lifetime of the store; objects
 * already on disk when the store opens start at generation 1.
 */
class LocalObjectStore : public ObjectStore {
public:
    explicit LocalObjectStore(std::filesystem::path root);

    std::string type_name() const override { return "local"; }

    Result<std::unique_ptr<ChunkTarget>> open_target(const std::string& name) override;
    Result<std::vector<ObjectInfo>> list(const std::string& prefix) const override;
    Result<void> remove(const ObjectInfo& object) override;
    Result<ObjectInfo> compose(const ComposeRequest& request) override;
    Result<std::vector<std::uint8_t>> get(const std::string& name) const override;

    const std::filesystem::path& root() const noexcept { return root_; }

    static constexpr const char* kStagingDirName = ".staging";

private:
    class FileTarget;

    Result<std::filesystem::path> object_path(const std::string& name) const;
    std::filesystem::path make_staging_path();
    Result<ObjectInfo> install(const std::filesystem::path& staged, const std::string& name);
    std::int64_t generation_of(const std::string& name) const;

    static Result<void> ensure_parent_exists(const std::filesystem::path& path);

    std::filesystem::path root_;
    std::filesystem::path staging_root_;

    // Serialises install/remove/compose so generations match file contents
    mutable std::mutex mutex_;
    mutable std::map<std::string, std::int64_t> generations_;
    std::int64_t next_generation_ = 2;
    std::atomic<std::uint64_t> staging_counter_{0};
};

} // namespace chunkup::storage
