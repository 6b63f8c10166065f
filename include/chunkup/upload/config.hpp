#pragma once

#include "chunkup/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace chunkup::upload {

/**
 * @brief Tuning for one ParallelWriter
 *
 * Memory held by a writer is roughly
 * chunk_size * (workers + queue_depth + 1).
 */
struct UploadConfig {
    static constexpr std::size_t kDefaultChunkSize = 5 * 1024 * 1024;
    static constexpr std::size_t kDefaultWorkers = 4;
    static constexpr std::size_t kDefaultQueueDepth = 1;
    static constexpr std::size_t kDefaultMaxComposeSources = 32;  ///< GCS compose limit

    std::size_t chunk_size = kDefaultChunkSize;
    std::size_t workers = kDefaultWorkers;
    std::size_t queue_depth = kDefaultQueueDepth;
    std::size_t max_compose_sources = kDefaultMaxComposeSources;

    Result<void> validate() const;
};

/**
 * @brief Parse a JSON document such as
 * {"chunk_size": 8388608, "workers": 8, "queue_depth": 1, "max_compose_sources": 32}
 *
 * Missing keys keep their defaults. The result is validated.
 */
Result<UploadConfig> upload_config_from_json(const std::string& text);

Result<UploadConfig> load_upload_config(const std::filesystem::path& path);

} // namespace chunkup::upload
