#include "chunkup/upload/lifecycle.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkup::upload {

const char* to_string(WriterState state) noexcept {
    switch (state) {
        case WriterState::Open: return "open";
        case WriterState::Closed: return "closed";
        case WriterState::Committed: return "committed";
        case WriterState::Cancelled: return "cancelled";
    }
    return "unknown";
}

WriterState UploadLifecycle::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

Result<void> UploadLifecycle::transition_to(WriterState next_state) {
    std::lock_guard lock(mutex_);
    if (state_ == next_state) {
        return Ok();
    }

    if (!can_transition(state_, next_state)) {
        return Err<void>(ErrorCode::InvalidArgument,
                         std::string("Illegal writer state transition ") + to_string(state_) +
                             " -> " + to_string(next_state));
    }

    state_ = next_state;
    return Ok();
}

bool UploadLifecycle::can_transition(WriterState current, WriterState target) {
    static const std::unordered_map<WriterState, std::vector<WriterState>> transitions {
        {WriterState::Open, {WriterState::Closed}},
        {WriterState::Closed, {WriterState::Committed, WriterState::Cancelled}},
        {WriterState::Committed, {WriterState::Cancelled}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace chunkup::upload
