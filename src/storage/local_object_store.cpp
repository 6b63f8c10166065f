#include "chunkup/storage/local_object_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace chunkup::storage {
namespace fs = std::filesystem;

namespace {

bool is_safe_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    const fs::path path(name);
    if (path.is_absolute() || path.has_root_name()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == ".." || part == "." || part == LocalObjectStore::kStagingDirName) {
            return false;
        }
    }
    return true;
}

Result<void> append_file(std::ofstream& out, const fs::path& source) {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorCode::IoError, "Failed to open compose source: " + source.string());
    }
    out << input.rdbuf();
    if (!out) {
        return Err<void>(ErrorCode::IoError, "Failed to append compose source: " + source.string());
    }
    return Ok();
}

} // namespace

class LocalObjectStore::FileTarget : public ChunkTarget {
public:
    FileTarget(LocalObjectStore& store, std::string name, fs::path staged)
        : store_(store), name_(std::move(name)), staged_(std::move(staged)),
          out_(staged_, std::ios::binary | std::ios::trunc) {}

    ~FileTarget() override {
        if (!committed_) {
            out_.close();
            std::error_code ec;
            fs::remove(staged_, ec);
        }
    }

    bool is_open() const { return out_.is_open(); }

    Result<void> write(const std::uint8_t* data, std::size_t size) override {
        if (committed_) {
            return Err<void>(ErrorCode::InvalidArgument, "write after commit: " + name_);
        }
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!out_) {
            return Err<void>(ErrorCode::IoError, "Failed to write staging file: " + staged_.string());
        }
        return Ok();
    }

    Result<ObjectInfo> commit() override {
        if (committed_) {
            return Err<ObjectInfo>(ErrorCode::InvalidArgument, "target already committed: " + name_);
        }
        out_.flush();
        out_.close();
        if (!out_) {
            return Err<ObjectInfo>(ErrorCode::IoError, "Failed to flush staging file: " + staged_.string());
        }

        auto installed = store_.install(staged_, name_);
        if (installed.is_ok()) {
            committed_ = true;
        }
        return installed;
    }

private:
    LocalObjectStore& store_;
    std::string name_;
    fs::path staged_;
    std::ofstream out_;
    bool committed_ = false;
};

LocalObjectStore::LocalObjectStore(fs::path root)
    : root_(std::move(root)),
      staging_root_(root_ / kStagingDirName) {
    // Failures surface as IoError/ListFailed from the first operation
    std::error_code ec;
    fs::create_directories(staging_root_, ec);
    if (ec) {
        spdlog::error("[LocalStore] root={} unusable: {}", root_.string(), ec.message());
        return;
    }
    spdlog::debug("[LocalStore] root={}", root_.string());
}

Result<std::unique_ptr<ChunkTarget>> LocalObjectStore::open_target(const std::string& name) {
    if (auto path = object_path(name); path.is_error()) {
        return Err<std::unique_ptr<ChunkTarget>>(path.error());
    }

    auto target = std::make_unique<FileTarget>(*this, name, make_staging_path());
    if (!target->is_open()) {
        return Err<std::unique_ptr<ChunkTarget>>(ErrorCode::IoError, "Failed to create staging file for " + name);
    }
    return Ok<std::unique_ptr<ChunkTarget>>(std::move(target));
}

Result<std::vector<ObjectInfo>> LocalObjectStore::list(const std::string& prefix) const {
    std::vector<ObjectInfo> entries;
    std::error_code ec;
    fs::recursive_directory_iterator it(root_, ec);
    if (ec) {
        return Err<std::vector<ObjectInfo>>(ErrorCode::ListFailed, "Failed to list " + root_.string() + ": " + ec.message());
    }

    const auto end = fs::end(it);
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return Err<std::vector<ObjectInfo>>(ErrorCode::ListFailed, "Failed to list " + root_.string() + ": " + ec.message());
        }
        if (it->is_directory(ec) && it->path().filename() == kStagingDirName) {
            it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        const std::string name = it->path().lexically_relative(root_).generic_string();
        if (name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const auto size = it->file_size(ec);
        if (ec) {
            return Err<std::vector<ObjectInfo>>(ErrorCode::ListFailed, "Failed to stat " + name + ": " + ec.message());
        }
        entries.push_back(ObjectInfo{name, 0, static_cast<std::uint64_t>(size)});
    }

    std::sort(entries.begin(), entries.end(), [](const ObjectInfo& a, const ObjectInfo& b) {
        return a.name < b.name;
    });

    std::lock_guard lock(mutex_);
    for (auto& entry : entries) {
        entry.generation = generation_of(entry.name);
    }
    return Ok(std::move(entries));
}

Result<void> LocalObjectStore::remove(const ObjectInfo& object) {
    auto path = object_path(object.name);
    if (path.is_error()) {
        return Err<void>(path.error());
    }

    std::lock_guard lock(mutex_);
    std::error_code ec;
    if (!fs::is_regular_file(path.value(), ec)) {
        return Err<void>(ErrorCode::NotFound, "no such object: " + object.name);
    }
    const auto current = generation_of(object.name);
    if (object.generation != 0 && current != object.generation) {
        return Err<void>(ErrorCode::PreconditionFailed, "generation mismatch deleting " + object.name);
    }

    fs::remove(path.value(), ec);
    if (ec) {
        return Err<void>(ErrorCode::DeleteFailed, "Failed to delete " + object.name + ": " + ec.message());
    }
    generations_.erase(object.name);
    return Ok();
}

Result<ObjectInfo> LocalObjectStore::compose(const ComposeRequest& request) {
    if (request.sources.empty()) {
        return Err<ObjectInfo>(ErrorCode::InvalidArgument, "compose needs at least one source");
    }
    auto dest_path = object_path(request.destination);
    if (dest_path.is_error()) {
        return Err<ObjectInfo>(dest_path.error());
    }

    const auto staged = make_staging_path();
    auto discard = [&staged](std::ofstream& out) {
        out.close();
        std::error_code ec;
        fs::remove(staged, ec);
    };

    std::lock_guard lock(mutex_);
    {
        std::ofstream out(staged, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<ObjectInfo>(ErrorCode::IoError, "Failed to create staging file: " + staged.string());
        }

        for (const auto& source : request.sources) {
            auto source_path = object_path(source.name);
            if (source_path.is_error()) {
                discard(out);
                return Err<ObjectInfo>(source_path.error());
            }
            std::error_code stat_ec;
            if (!fs::is_regular_file(source_path.value(), stat_ec)) {
                discard(out);
                return Err<ObjectInfo>(ErrorCode::NotFound, "compose source missing: " + source.name);
            }
            if (source.generation != 0 && generation_of(source.name) != source.generation) {
                discard(out);
                return Err<ObjectInfo>(ErrorCode::PreconditionFailed,
                                       "compose source generation changed: " + source.name);
            }
            if (auto appended = append_file(out, source_path.value()); appended.is_error()) {
                discard(out);
                return Err<ObjectInfo>(appended.error());
            }
        }
    }

    if (auto res = ensure_parent_exists(dest_path.value()); res.is_error()) {
        return Err<ObjectInfo>(res.error());
    }

    std::error_code ec;
    fs::rename(staged, dest_path.value(), ec);
    if (ec) {
        fs::remove(staged, ec);
        return Err<ObjectInfo>(ErrorCode::ComposeFailed, "Failed to move composed object: " + request.destination);
    }

    const auto generation = next_generation_++;
    generations_[request.destination] = generation;
    const auto size = fs::file_size(dest_path.value(), ec);
    if (ec) {
        return Err<ObjectInfo>(ErrorCode::IoError, "Failed to stat composed object " + request.destination + ": " + ec.message());
    }
    return Ok(ObjectInfo{request.destination, generation, static_cast<std::uint64_t>(size)});
}

Result<std::vector<std::uint8_t>> LocalObjectStore::get(const std::string& name) const {
    auto path = object_path(name);
    if (path.is_error()) {
        return Err<std::vector<std::uint8_t>>(path.error());
    }

    std::ifstream input(path.value(), std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::NotFound, "no such object: " + name);
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)),
                                   std::istreambuf_iterator<char>());
    return Ok(std::move(data));
}

Result<fs::path> LocalObjectStore::object_path(const std::string& name) const {
    if (!is_safe_name(name)) {
        return Err<fs::path>(ErrorCode::InvalidArgument, "invalid object name: " + name);
    }
    return Ok(root_ / fs::path(name));
}

fs::path LocalObjectStore::make_staging_path() {
    std::ostringstream oss;
    oss << "part-" << ++staging_counter_;
    return staging_root_ / oss.str();
}

Result<ObjectInfo> LocalObjectStore::install(const fs::path& staged, const std::string& name) {
    auto dest_path = object_path(name);
    if (dest_path.is_error()) {
        return Err<ObjectInfo>(dest_path.error());
    }
    if (auto res = ensure_parent_exists(dest_path.value()); res.is_error()) {
        return Err<ObjectInfo>(res.error());
    }

    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::rename(staged, dest_path.value(), ec);
    if (ec) {
        return Err<ObjectInfo>(ErrorCode::IoError, "Failed to move staging file: " + dest_path.value().string());
    }

    const auto generation = next_generation_++;
    generations_[name] = generation;
    const auto size = fs::file_size(dest_path.value(), ec);
    if (ec) {
        return Err<ObjectInfo>(ErrorCode::IoError, "Failed to stat " + dest_path.value().string() + ": " + ec.message());
    }
    return Ok(ObjectInfo{name, generation, static_cast<std::uint64_t>(size)});
}

// Caller holds mutex_
std::int64_t LocalObjectStore::generation_of(const std::string& name) const {
    auto it = generations_.find(name);
    if (it == generations_.end()) {
        it = generations_.emplace(name, 1).first;
    }
    return it->second;
}

Result<void> LocalObjectStore::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    std::error_code check_ec;
    if (ec && !fs::is_directory(parent, check_ec)) {
        return Err<void>(ErrorCode::IoError, "Failed to create directory: " + parent.string());
    }
    return Ok();
}

} // namespace chunkup::storage
