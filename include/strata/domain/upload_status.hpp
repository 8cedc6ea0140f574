#pragma once

#include "strata/core/clock.hpp"
#include "strata/core/result.hpp"

namespace strata::domain {

enum class UploadState {
    Pending,
    Uploading,
    Completed,
    Failed,
    Archived
};

const char* to_string(UploadState state);

/**
 * @brief Lifecycle state of a file record plus the time it last changed
 *
 * Allowed moves:
 *   Pending   -> Uploading | Failed
 *   Uploading -> Completed | Failed
 *   Completed -> Archived  | Failed
 *   Failed    -> Pending
 *   X         -> X          (for every X except Archived)
 *
 * Archived is terminal. Any other move fails with InvalidTransition.
 */
class UploadStatus {
public:
    static UploadStatus pending(TimePoint now) { return UploadStatus(UploadState::Pending, now); }

    [[nodiscard]] UploadState state() const noexcept { return state_; }
    [[nodiscard]] TimePoint changed_at() const noexcept { return changed_at_; }

    [[nodiscard]] bool is(UploadState state) const noexcept { return state_ == state; }

    [[nodiscard]] bool can_transition_to(UploadState target) const noexcept;

    /// New status stamped with @p now, or InvalidTransition naming both states
    [[nodiscard]] Result<UploadStatus> transition_to(UploadState target, TimePoint now) const;

    bool operator==(const UploadStatus& other) const {
        return state_ == other.state_ && changed_at_ == other.changed_at_;
    }
    bool operator!=(const UploadStatus& other) const { return !(*this == other); }

private:
    UploadStatus(UploadState state, TimePoint changed_at) : state_(state), changed_at_(changed_at) {}

    UploadState state_;
    TimePoint changed_at_;
};

} // namespace strata::domain
