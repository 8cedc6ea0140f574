#include "strata/domain/upload_status.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace strata::domain {
namespace {

bool is_allowed(UploadState current, UploadState target) {
    static const std::unordered_map<UploadState, std::vector<UploadState>> transitions {
        {UploadState::Pending, {UploadState::Uploading, UploadState::Failed}},
        {UploadState::Uploading, {UploadState::Completed, UploadState::Failed}},
        {UploadState::Completed, {UploadState::Archived, UploadState::Failed}},
        {UploadState::Failed, {UploadState::Pending}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(UploadState state) {
    switch (state) {
        case UploadState::Pending: return "Pending";
        case UploadState::Uploading: return "Uploading";
        case UploadState::Completed: return "Completed";
        case UploadState::Failed: return "Failed";
        case UploadState::Archived: return "Archived";
    }
    return "Unknown";
}

bool UploadStatus::can_transition_to(UploadState target) const noexcept {
    if (state_ == UploadState::Archived) {
        return false;
    }
    if (state_ == target) {
        return true;
    }
    return is_allowed(state_, target);
}

Result<UploadStatus> UploadStatus::transition_to(UploadState target, TimePoint now) const {
    if (!can_transition_to(target)) {
        return Err<UploadStatus>(ErrorKind::InvalidTransition,
                                 std::string("Cannot transition from ") + to_string(state_) +
                                 " to " + to_string(target));
    }
    return Ok(UploadStatus(target, now));
}

} // namespace strata::domain
