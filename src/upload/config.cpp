#include "chunkup/upload/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace chunkup::upload {

using json = nlohmann::json;

namespace {

Result<void> read_size(const json& doc, const char* key, std::size_t& out) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return Ok();
    }
    if (!it->is_number_unsigned()) {
        return Err<void>(ErrorCode::InvalidArgument,
                         std::string("config key '") + key + "' must be a non-negative integer");
    }
    out = it->get<std::size_t>();
    return Ok();
}

} // namespace

Result<void> UploadConfig::validate() const {
    if (chunk_size == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "chunk_size must be > 0");
    }
    if (workers == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "workers must be > 0");
    }
    if (queue_depth == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "queue_depth must be > 0");
    }
    if (max_compose_sources < 2) {
        return Err<void>(ErrorCode::InvalidArgument, "max_compose_sources must be >= 2");
    }
    return Ok();
}

Result<UploadConfig> upload_config_from_json(const std::string& text) {
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return Err<UploadConfig>(ErrorCode::InvalidArgument, "config is not valid JSON");
    }
    if (!doc.is_object()) {
        return Err<UploadConfig>(ErrorCode::InvalidArgument, "config must be a JSON object");
    }

    UploadConfig config;
    for (auto res : {read_size(doc, "chunk_size", config.chunk_size),
                     read_size(doc, "workers", config.workers),
                     read_size(doc, "queue_depth", config.queue_depth),
                     read_size(doc, "max_compose_sources", config.max_compose_sources)}) {
        if (res.is_error()) {
            return Err<UploadConfig>(res.error());
        }
    }

    if (auto valid = config.validate(); valid.is_error()) {
        return Err<UploadConfig>(valid.error());
    }
    return Ok(config);
}

Result<UploadConfig> load_upload_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<UploadConfig>(ErrorCode::NotFound, "Failed to open config file: " + path.string());
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    return upload_config_from_json(oss.str());
}

} // namespace chunkup::upload
