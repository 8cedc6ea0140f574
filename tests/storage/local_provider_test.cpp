#include "strata/storage/local_provider.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

using namespace strata;
using namespace strata::storage;
using strata::test_support::ManualClock;
using strata::test_support::create_temp_dir;
using strata::test_support::slurp;

class LocalProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("strata_local_provider_test");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    core::ProviderConfig hot_config() const {
        core::ProviderConfig config;
        config.name = "s3-standard";
        config.root = root_ / "hot";
        return config;
    }

    core::ProviderConfig cold_config() const {
        core::ProviderConfig config;
        config.name = "s3-glacier-deep";
        config.root = root_ / "cold";
        config.instant_access = false;
        config.supports_retrieval = true;
        config.supports_deletion = false;
        config.min_restore_time = std::chrono::minutes(60);
        config.max_restore_time = std::chrono::minutes(180);
        config.restore_window = std::chrono::hours(24);
        return config;
    }

    static UploadReceipt store(StorageProvider& provider, const std::string& content,
                               const std::string& name = "photo.JPG") {
        std::istringstream in(content);
        UploadOptions options{name, "image/jpeg", {}};
        auto receipt = provider.upload(in, options, {});
        EXPECT_TRUE(receipt.is_ok());
        return receipt.value();
    }

    std::filesystem::path root_;
    ManualClock clock_;
};

TEST_F(LocalProviderTest, CreateValidatesConfig) {
    core::ProviderConfig nameless = hot_config();
    nameless.name.clear();
    EXPECT_EQ(LocalDirectoryProvider::create(nameless).error().kind, ErrorKind::InvalidArgument);

    core::ProviderConfig rootless = hot_config();
    rootless.root.clear();
    EXPECT_EQ(LocalDirectoryProvider::create(rootless).error().kind, ErrorKind::InvalidArgument);

    core::ProviderConfig inverted = cold_config();
    inverted.max_restore_time = std::chrono::minutes(1);
    EXPECT_EQ(LocalDirectoryProvider::create(inverted).error().kind, ErrorKind::InvalidArgument);
}

TEST_F(LocalProviderTest, UploadThenDownloadRoundTrips) {
    auto provider = LocalDirectoryProvider::create(hot_config(), clock_.fn()).value();
    auto receipt = store(*provider, "jpeg bytes");

    EXPECT_EQ(receipt.location.provider_name(), "s3-standard");
    EXPECT_EQ(receipt.location.path().rfind("objects/", 0), 0u);
    EXPECT_EQ(std::filesystem::path(receipt.location.path()).extension(), ".jpg");
    EXPECT_EQ(receipt.uploaded_at, clock_.now());

    auto stream = provider->download(receipt.location, {});
    ASSERT_TRUE(stream.is_ok());
    EXPECT_EQ(slurp(*stream.value()), "jpeg bytes");
}

TEST_F(LocalProviderTest, CancelledUploadLeavesNothingBehind) {
    auto provider = LocalDirectoryProvider::create(hot_config()).value();
    CancellationSource source;
    source.cancel();

    std::istringstream in("bytes");
    auto receipt = provider->upload(in, UploadOptions{"a.txt", "text/plain", {}}, source.token());
    ASSERT_TRUE(receipt.is_error());
    EXPECT_EQ(receipt.error().kind, ErrorKind::Cancelled);
    EXPECT_FALSE(std::filesystem::exists(provider->root() / "objects"));
}

TEST_F(LocalProviderTest, ColdObjectNeedsRestoreBeforeDownload) {
    auto provider = LocalDirectoryProvider::create(cold_config(), clock_.fn()).value();
    auto receipt = store(*provider, "archived");

    auto refused = provider->download(receipt.location, {});
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().kind, ErrorKind::RestoreRequired);
}

TEST_F(LocalProviderTest, RestoreJobMovesThroughItsStates) {
    auto provider = LocalDirectoryProvider::create(cold_config(), clock_.fn()).value();
    auto receipt = store(*provider, "archived");

    auto ticket = provider->initiate_retrieval(receipt.location, RetrievalTier::Standard, {});
    ASSERT_TRUE(ticket.is_ok());
    EXPECT_EQ(ticket.value().retrieval_id.rfind("restore-", 0), 0u);
    EXPECT_EQ(ticket.value().estimated_duration, std::chrono::minutes(120));
    EXPECT_EQ(ticket.value().state, RetrievalState::Requested);

    const auto& id = ticket.value().retrieval_id;
    EXPECT_EQ(provider->retrieval_status(id, {}).value().state, RetrievalState::Requested);

    clock_.advance(std::chrono::minutes(60));
    auto halfway = provider->retrieval_status(id, {}).value();
    EXPECT_EQ(halfway.state, RetrievalState::InProgress);
    EXPECT_EQ(halfway.progress, 50);
    EXPECT_TRUE(provider->download(receipt.location, {}).is_error());

    clock_.advance(std::chrono::minutes(60));
    auto ready = provider->retrieval_status(id, {}).value();
    EXPECT_EQ(ready.state, RetrievalState::Ready);
    EXPECT_EQ(ready.progress, 100);
    ASSERT_TRUE(ready.completed_at.has_value());

    auto stream = provider->download(receipt.location, {});
    ASSERT_TRUE(stream.is_ok());
    EXPECT_EQ(slurp(*stream.value()), "archived");

    clock_.advance(std::chrono::hours(24));
    EXPECT_EQ(provider->retrieval_status(id, {}).value().state, RetrievalState::Expired);
    EXPECT_EQ(provider->download(receipt.location, {}).error().kind, ErrorKind::RestoreRequired);
}

TEST_F(LocalProviderTest, ExpiredRestoreJobsAreDropped) {
    auto provider = LocalDirectoryProvider::create(cold_config(), clock_.fn()).value();
    auto first = store(*provider, "first");
    auto second = store(*provider, "second");

    const auto stale = provider->initiate_retrieval(first.location, RetrievalTier::Expedited, {}).value().retrieval_id;

    // Ready after 1h, expired after 25h, dropped one restore window later
    clock_.advance(std::chrono::hours(25));
    EXPECT_EQ(provider->retrieval_status(stale, {}).value().state, RetrievalState::Expired);
    clock_.advance(std::chrono::hours(24));

    const auto fresh = provider->initiate_retrieval(second.location, RetrievalTier::Expedited, {}).value().retrieval_id;
    auto dropped = provider->retrieval_status(stale, {});
    ASSERT_TRUE(dropped.is_error());
    EXPECT_EQ(dropped.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(provider->download(first.location, {}).error().kind, ErrorKind::RestoreRequired);

    clock_.advance(std::chrono::hours(1));
    EXPECT_EQ(provider->retrieval_status(fresh, {}).value().state, RetrievalState::Ready);
    EXPECT_TRUE(provider->download(second.location, {}).is_ok());
}

TEST_F(LocalProviderTest, RestoreTimeFollowsTier) {
    auto provider = LocalDirectoryProvider::create(cold_config(), clock_.fn()).value();
    auto receipt = store(*provider, "archived");

    EXPECT_EQ(provider->initiate_retrieval(receipt.location, RetrievalTier::Expedited, {}).value().estimated_duration,
              std::chrono::minutes(60));
    EXPECT_EQ(provider->initiate_retrieval(receipt.location, RetrievalTier::Bulk, {}).value().estimated_duration,
              std::chrono::minutes(180));
}

TEST_F(LocalProviderTest, RetrievalRequiresCapability) {
    auto provider = LocalDirectoryProvider::create(hot_config()).value();
    auto receipt = store(*provider, "hot");

    auto ticket = provider->initiate_retrieval(receipt.location, RetrievalTier::Standard, {});
    ASSERT_TRUE(ticket.is_error());
    EXPECT_EQ(ticket.error().kind, ErrorKind::BackendFailure);
}

TEST_F(LocalProviderTest, UnknownRetrievalIdIsNotFound) {
    auto provider = LocalDirectoryProvider::create(cold_config()).value();
    auto status = provider->retrieval_status("restore-missing", {});
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().kind, ErrorKind::NotFound);
}

TEST_F(LocalProviderTest, RejectsForeignAndEscapingLocations) {
    auto provider = LocalDirectoryProvider::create(hot_config()).value();

    auto foreign = domain::StorageLocation::create("backblaze", "objects/ab/file.jpg").value();
    EXPECT_EQ(provider->download(foreign, {}).error().kind, ErrorKind::InvalidArgument);

    auto escaping = domain::StorageLocation::create("s3-standard", "objects/../../etc/passwd").value();
    EXPECT_EQ(provider->download(escaping, {}).error().kind, ErrorKind::InvalidArgument);

    auto missing = domain::StorageLocation::create("s3-standard", "objects/zz/none.jpg").value();
    EXPECT_EQ(provider->download(missing, {}).error().kind, ErrorKind::NotFound);
}

TEST_F(LocalProviderTest, RemoveHonoursDeletionCapability) {
    auto hot = LocalDirectoryProvider::create(hot_config()).value();
    auto receipt = store(*hot, "bytes");
    EXPECT_TRUE(hot->remove(receipt.location, {}).value());
    EXPECT_FALSE(hot->remove(receipt.location, {}).value());

    auto cold = LocalDirectoryProvider::create(cold_config()).value();
    auto archived = store(*cold, "bytes");
    EXPECT_EQ(cold->remove(archived.location, {}).error().kind, ErrorKind::BackendFailure);
}

TEST_F(LocalProviderTest, HealthCheckProbesRoot) {
    auto provider = LocalDirectoryProvider::create(hot_config()).value();
    auto status = provider->health_check({});
    EXPECT_TRUE(status.healthy);
    EXPECT_NE(status.message.find("writable"), std::string::npos);
}
