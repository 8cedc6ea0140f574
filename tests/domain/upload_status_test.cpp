#include "strata/domain/upload_status.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <utility>
#include <vector>

using strata::ErrorKind;
using strata::TimePoint;
using strata::domain::UploadState;
using strata::domain::UploadStatus;

namespace {

const std::vector<UploadState> kAllStates = {
    UploadState::Pending, UploadState::Uploading, UploadState::Completed, UploadState::Failed, UploadState::Archived};

const std::set<std::pair<UploadState, UploadState>> kAllowed = {
    {UploadState::Pending, UploadState::Uploading},
    {UploadState::Pending, UploadState::Failed},
    {UploadState::Uploading, UploadState::Completed},
    {UploadState::Uploading, UploadState::Failed},
    {UploadState::Completed, UploadState::Archived},
    {UploadState::Completed, UploadState::Failed},
    {UploadState::Failed, UploadState::Pending},
    {UploadState::Pending, UploadState::Pending},
    {UploadState::Uploading, UploadState::Uploading},
    {UploadState::Completed, UploadState::Completed},
    {UploadState::Failed, UploadState::Failed},
};

/// Walks Pending along allowed edges until it reaches `state`
UploadStatus status_in(UploadState state, TimePoint at) {
    auto status = UploadStatus::pending(at);
    switch (state) {
        case UploadState::Pending:
            return status;
        case UploadState::Uploading:
            return status.transition_to(UploadState::Uploading, at).value();
        case UploadState::Failed:
            return status.transition_to(UploadState::Failed, at).value();
        case UploadState::Completed:
            return status_in(UploadState::Uploading, at).transition_to(UploadState::Completed, at).value();
        case UploadState::Archived:
            return status_in(UploadState::Completed, at).transition_to(UploadState::Archived, at).value();
    }
    return status;
}

} // namespace

TEST(UploadStatusTest, StartsPending) {
    const TimePoint t0{std::chrono::seconds(100)};
    auto status = UploadStatus::pending(t0);
    EXPECT_TRUE(status.is(UploadState::Pending));
    EXPECT_EQ(status.changed_at(), t0);
}

TEST(UploadStatusTest, FollowsTransitionTableExactly) {
    const TimePoint t0{std::chrono::seconds(100)};
    const TimePoint t1{std::chrono::seconds(200)};

    for (auto from : kAllStates) {
        for (auto to : kAllStates) {
            auto result = status_in(from, t0).transition_to(to, t1);
            if (kAllowed.count({from, to})) {
                ASSERT_TRUE(result.is_ok()) << to_string(from) << " -> " << to_string(to);
                EXPECT_EQ(result.value().state(), to);
                EXPECT_EQ(result.value().changed_at(), t1);
            } else {
                ASSERT_TRUE(result.is_error()) << to_string(from) << " -> " << to_string(to);
                EXPECT_EQ(result.error().kind, ErrorKind::InvalidTransition);
            }
        }
    }
}

TEST(UploadStatusTest, ArchivedIsTerminal) {
    auto archived = status_in(UploadState::Archived, TimePoint{});
    for (auto target : kAllStates) {
        EXPECT_FALSE(archived.can_transition_to(target));
    }
    auto again = archived.transition_to(UploadState::Archived, TimePoint{});
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().message, "Cannot transition from Archived to Archived");
}
