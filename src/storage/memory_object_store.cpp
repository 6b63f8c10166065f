#include "chunkup/storage/memory_object_store.hpp"

#include "chunkup/storage/compose_request.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace chunkup::storage {

class MemoryObjectStore::MemoryTarget : public ChunkTarget {
public:
    MemoryTarget(MemoryObjectStore& store, std::string name)
        : store_(store), name_(std::move(name)) {}

    Result<void> write(const std::uint8_t* data, std::size_t size) override {
        if (committed_) {
            return Err<void>(ErrorCode::InvalidArgument, "write after commit: " + name_);
        }
        if (store_.should_fail(store_.fail_write_, name_)) {
            return Err<void>(ErrorCode::IoError, "injected write failure: " + name_);
        }
        data_.insert(data_.end(), data, data + size);
        return Ok();
    }

    Result<ObjectInfo> commit() override {
        if (committed_) {
            return Err<ObjectInfo>(ErrorCode::InvalidArgument, "target already committed: " + name_);
        }

        ++store_.commit_calls_;
        const auto active = ++store_.active_commits_;
        auto peak = store_.peak_concurrent_commits_.load();
        while (active > peak && !store_.peak_concurrent_commits_.compare_exchange_weak(peak, active)) {
        }

        std::chrono::milliseconds delay{0};
        {
            std::lock_guard lock(store_.faults_mutex_);
            delay = store_.commit_delay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        --store_.active_commits_;
        if (store_.should_fail(store_.fail_commit_, name_)) {
            return Err<ObjectInfo>(ErrorCode::IoError, "injected commit failure: " + name_);
        }

        committed_ = true;
        return store_.publish(name_, std::move(data_));
    }

private:
    MemoryObjectStore& store_;
    std::string name_;
    std::vector<std::uint8_t> data_;
    bool committed_ = false;
};

Result<std::unique_ptr<ChunkTarget>> MemoryObjectStore::open_target(const std::string& name) {
    if (name.empty()) {
        return Err<std::unique_ptr<ChunkTarget>>(ErrorCode::InvalidArgument, "empty object name");
    }
    if (should_fail(fail_open_, name)) {
        return Err<std::unique_ptr<ChunkTarget>>(ErrorCode::IoError, "injected open failure: " + name);
    }
    return Ok<std::unique_ptr<ChunkTarget>>(std::make_unique<MemoryTarget>(*this, name));
}

Result<std::vector<ObjectInfo>> MemoryObjectStore::list(const std::string& prefix) const {
    std::vector<ObjectInfo> entries;
    {
        std::shared_lock lock(mutex_);
        for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) {
                break;
            }
            entries.push_back(ObjectInfo{it->first, it->second.generation, it->second.data.size()});
        }
    }

    bool reverse = false;
    {
        std::lock_guard lock(faults_mutex_);
        reverse = reverse_listing_;
    }
    if (reverse) {
        std::reverse(entries.begin(), entries.end());
    }
    return Ok(std::move(entries));
}

Result<void> MemoryObjectStore::remove(const ObjectInfo& object) {
    ++remove_calls_;
    if (should_fail(fail_remove_, object.name)) {
        return Err<void>(ErrorCode::DeleteFailed, "injected delete failure: " + object.name);
    }

    std::unique_lock lock(mutex_);
    auto it = objects_.find(object.name);
    if (it == objects_.end()) {
        return Err<void>(ErrorCode::NotFound, "no such object: " + object.name);
    }
    if (object.generation != 0 && it->second.generation != object.generation) {
        return Err<void>(ErrorCode::PreconditionFailed,
                         "generation mismatch deleting " + object.name + ": expected " +
                             std::to_string(object.generation) + ", found " +
                             std::to_string(it->second.generation));
    }
    objects_.erase(it);
    return Ok();
}

Result<ObjectInfo> MemoryObjectStore::compose(const ComposeRequest& request) {
    ++compose_calls_;
    {
        std::lock_guard lock(faults_mutex_);
        compose_bodies_.push_back(to_json_body(request));
        if (fail_compose_count_ > 0) {
            --fail_compose_count_;
            return Err<ObjectInfo>(ErrorCode::ComposeFailed, "injected compose failure: " + request.destination);
        }
    }

    if (request.destination.empty() || request.sources.empty()) {
        return Err<ObjectInfo>(ErrorCode::InvalidArgument, "compose needs a destination and sources");
    }

    std::unique_lock lock(mutex_);
    std::vector<std::uint8_t> merged;
    for (const auto& source : request.sources) {
        auto it = objects_.find(source.name);
        if (it == objects_.end()) {
            return Err<ObjectInfo>(ErrorCode::NotFound, "compose source missing: " + source.name);
        }
        if (source.generation != 0 && it->second.generation != source.generation) {
            return Err<ObjectInfo>(ErrorCode::PreconditionFailed,
                                   "compose source generation changed: " + source.name);
        }
        merged.insert(merged.end(), it->second.data.begin(), it->second.data.end());
    }

    auto& dest = objects_[request.destination];
    dest.data = std::move(merged);
    dest.generation = next_generation_++;
    spdlog::debug("[MemoryStore] composed {} sources into {} gen={}",
                  request.sources.size(), request.destination, dest.generation);
    return Ok(ObjectInfo{request.destination, dest.generation, dest.data.size()});
}

Result<std::vector<std::uint8_t>> MemoryObjectStore::get(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = objects_.find(name);
    if (it == objects_.end()) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::NotFound, "no such object: " + name);
    }
    return Ok(it->second.data);
}

ObjectInfo MemoryObjectStore::put_object(const std::string& name, const std::string& data) {
    auto result = publish(name, std::vector<std::uint8_t>(data.begin(), data.end()));
    return result.value();
}

bool MemoryObjectStore::contains(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return objects_.count(name) > 0;
}

std::size_t MemoryObjectStore::object_count() const {
    std::shared_lock lock(mutex_);
    return objects_.size();
}

void MemoryObjectStore::fail_open(const std::string& name) {
    std::lock_guard lock(faults_mutex_);
    fail_open_.insert(name);
}

void MemoryObjectStore::fail_write(const std::string& name) {
    std::lock_guard lock(faults_mutex_);
    fail_write_.insert(name);
}

void MemoryObjectStore::fail_commit(const std::string& name) {
    std::lock_guard lock(faults_mutex_);
    fail_commit_.insert(name);
}

void MemoryObjectStore::fail_remove(const std::string& name) {
    std::lock_guard lock(faults_mutex_);
    fail_remove_.insert(name);
}

void MemoryObjectStore::fail_next_compose(std::size_t count) {
    std::lock_guard lock(faults_mutex_);
    fail_compose_count_ = count;
}

void MemoryObjectStore::clear_faults() {
    std::lock_guard lock(faults_mutex_);
    fail_open_.clear();
    fail_write_.clear();
    fail_commit_.clear();
    fail_remove_.clear();
    fail_compose_count_ = 0;
}

void MemoryObjectStore::set_reverse_listing(bool reverse) {
    std::lock_guard lock(faults_mutex_);
    reverse_listing_ = reverse;
}

void MemoryObjectStore::set_commit_delay(std::chrono::milliseconds delay) {
    std::lock_guard lock(faults_mutex_);
    commit_delay_ = delay;
}

std::vector<std::string> MemoryObjectStore::compose_bodies() const {
    std::lock_guard lock(faults_mutex_);
    return compose_bodies_;
}

Result<ObjectInfo> MemoryObjectStore::publish(const std::string& name, std::vector<std::uint8_t> data) {
    std::unique_lock lock(mutex_);
    auto& stored = objects_[name];
    stored.data = std::move(data);
    stored.generation = next_generation_++;
    return Ok(ObjectInfo{name, stored.generation, stored.data.size()});
}

bool MemoryObjectStore::should_fail(const std::set<std::string>& names, const std::string& name) const {
    std::lock_guard lock(faults_mutex_);
    return names.count(name) > 0;
}

} // namespace chunkup::storage
