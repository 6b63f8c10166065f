#pragma once

#include "chunkup/core/result.hpp"

#include <mutex>

namespace chunkup::upload {

enum class WriterState {
    Open,
    Closed,
    Committed,
    Cancelled
};

const char* to_string(WriterState state) noexcept;

/**
 * @brief Thread-safe writer state machine
 *
 * Open -> Closed -> Committed | Cancelled, plus Committed -> Cancelled so an
 * already composed object can still be removed. Re-entering the current
 * state always succeeds.
 */
class UploadLifecycle {
public:
    UploadLifecycle() = default;

    UploadLifecycle(const UploadLifecycle&) = delete;
    UploadLifecycle& operator=(const UploadLifecycle&) = delete;

    [[nodiscard]] WriterState state() const;
    [[nodiscard]] bool is_open() const { return state() == WriterState::Open; }

    Result<void> transition_to(WriterState next_state);

private:
    [[nodiscard]] static bool can_transition(WriterState current, WriterState target);

    mutable std::mutex mutex_;
    WriterState state_ = WriterState::Open;
};

} // namespace chunkup::upload
