#pragma once

/**
 * @file memory_object_store.hpp
 * @brief Thread-safe in-process object store
 *
 * Behaves like a bucket: objects keyed by name, a fresh generation on every
 * replacement, lexicographic prefix listing and compose with generation
 * preconditions. Used by the test suite and as a dry-run backend.
 *
 * FAULT INJECTION:
 * Individual object names can be marked to fail at target creation, write,
 * commit or delete; compose calls can be failed; listing order can be
 * reversed to prove callers do not depend on it; commits can be slowed to
 * make concurrency observable.
 */

#include "chunkup/storage/object_store.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>

namespace chunkup::storage {

class MemoryObjectStore : public ObjectStore {
public:
    MemoryObjectStore() = default;

    std::string type_name() const override { return "memory"; }

    Result<std::unique_ptr<ChunkTarget>> open_target(const std::string& name) override;
    Result<std::vector<ObjectInfo>> list(const std::string& prefix) const override;
    Result<void> remove(const ObjectInfo& object) override;
    Result<ObjectInfo> compose(const ComposeRequest& request) override;
    Result<std::vector<std::uint8_t>> get(const std::string& name) const override;

    // Seed an object directly, bypassing targets
    ObjectInfo put_object(const std::string& name, const std::string& data);

    bool contains(const std::string& name) const;
    std::size_t object_count() const;

    // Fault injection
    void fail_open(const std::string& name);
    void fail_write(const std::string& name);
    void fail_commit(const std::string& name);
    void fail_remove(const std::string& name);
    void fail_next_compose(std::size_t count = 1);
    void clear_faults();
    void set_reverse_listing(bool reverse);
    void set_commit_delay(std::chrono::milliseconds delay);

    // Observations
    std::size_t commit_calls() const noexcept { return commit_calls_.load(); }
    std::size_t compose_calls() const noexcept { return compose_calls_.load(); }
    std::size_t remove_calls() const noexcept { return remove_calls_.load(); }
    std::size_t peak_concurrent_commits() const noexcept { return peak_concurrent_commits_.load(); }
    std::vector<std::string> compose_bodies() const;

private:
    class MemoryTarget;

    struct StoredObject {
        std::vector<std::uint8_t> data;
        std::int64_t generation = 0;
    };

    Result<ObjectInfo> publish(const std::string& name, std::vector<std::uint8_t> data);
    bool should_fail(const std::set<std::string>& names, const std::string& name) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, StoredObject> objects_;
    std::int64_t next_generation_ = 1;

    mutable std::mutex faults_mutex_;
    std::set<std::string> fail_open_;
    std::set<std::string> fail_write_;
    std::set<std::string> fail_commit_;
    std::set<std::string> fail_remove_;
    std::size_t fail_compose_count_ = 0;
    bool reverse_listing_ = false;
    std::chrono::milliseconds commit_delay_{0};
    std::vector<std::string> compose_bodies_;

    std::atomic<std::size_t> commit_calls_{0};
    std::atomic<std::size_t> compose_calls_{0};
    std::atomic<std::size_t> remove_calls_{0};
    std::atomic<std::size_t> active_commits_{0};
    std::atomic<std::size_t> peak_concurrent_commits_{0};
};

} // namespace chunkup::storage
