#include "strata/orchestration/engine.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

using namespace strata;
using namespace strata::orchestration;
using namespace strata::test_support;

class StorageEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("strata_engine_test");

        config_.logging.level = "warn";
        config_.worker_threads = 2;
        config_.chunked.default_chunk_size = 4;
        config_.chunked.staging_root = root_ / "staging";

        core::ProviderConfig standard;
        standard.name = "s3-standard";
        standard.root = root_ / "standard";

        core::ProviderConfig deep;
        deep.name = "s3-glacier-deep";
        deep.root = root_ / "deep";
        deep.instant_access = false;
        deep.supports_retrieval = true;
        deep.min_restore_time = std::chrono::minutes(60);
        deep.max_restore_time = std::chrono::minutes(180);

        core::ProviderConfig flexible = deep;
        flexible.name = "s3-glacier-flexible";
        flexible.root = root_ / "flexible";
        flexible.min_restore_time = std::chrono::minutes(1);
        flexible.max_restore_time = std::chrono::minutes(5);

        config_.providers = {standard, deep, flexible};
    }

    void TearDown() override {
        engine_.reset();
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    StorageEngine& engine() {
        if (!engine_) {
            StorageEngine::Options options;
            options.clock = clock_.fn();
            auto created = StorageEngine::create(config_, options);
            EXPECT_TRUE(created.is_ok()) << (created.is_error() ? created.error().message : "");
            engine_ = std::move(created.value());
        }
        return *engine_;
    }

    UploadRequest photo(const std::string& name = "beach.jpg") {
        return UploadRequest{owner_, name, "image/jpeg", clock_.now(), std::nullopt, {"holiday"}};
    }

    std::filesystem::path root_;
    core::EngineConfig config_;
    ManualClock clock_;
    domain::UserId owner_ = domain::UserId::generate();
    std::unique_ptr<StorageEngine> engine_;
};

TEST_F(StorageEngineTest, RejectsEmptyWorkerPool) {
    config_.worker_threads = 0;
    auto created = StorageEngine::create(config_);
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(StorageEngineTest, UnknownProviderKindFailsStartup) {
    config_.providers[0].kind = "tape-robot";
    auto created = StorageEngine::create(config_);
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(StorageEngineTest, NoProvidersFailsStartup) {
    config_.providers.clear();
    auto created = StorageEngine::create(config_);
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, ErrorKind::NoProvidersAvailable);
}

TEST_F(StorageEngineTest, RegisteredKindsAreBuilt) {
    auto fake = std::make_shared<FakeStorageProvider>("fake-hot");
    core::ProviderConfig extra;
    extra.name = "fake-hot";
    extra.kind = "fake";
    config_.providers.push_back(extra);

    StorageEngine::Options options;
    options.register_kinds = [fake](storage::ProviderFactory& factory) {
        factory.register_kind("fake", [fake](const core::ProviderConfig&) {
            return Ok<storage::ProviderPtr>(fake);
        });
    };
    auto created = StorageEngine::create(config_, options);
    ASSERT_TRUE(created.is_ok()) << created.error().message;
    EXPECT_EQ(created.value()->registry().size(), 4u);
    EXPECT_EQ(created.value()->registry().find("FAKE-HOT"), fake);
}

TEST_F(StorageEngineTest, PhotoRoundTripThroughDeepArchive) {
    std::istringstream data("sunset pixels");
    auto stored = engine().upload(photo(), data);
    ASSERT_TRUE(stored.is_ok()) << stored.error().message;
    EXPECT_FALSE(stored.value().duplicate);
    EXPECT_EQ(stored.value().location->provider_name(), "s3-glacier-deep");
    EXPECT_TRUE(std::filesystem::exists(root_ / "deep" / stored.value().location->path()));

    const auto id = stored.value().file_id;
    EXPECT_EQ(engine().download(id).error().kind, ErrorKind::RestoreRequired);

    auto ticket = engine().initiate_retrieval(id, storage::RetrievalTier::Expedited);
    ASSERT_TRUE(ticket.is_ok()) << ticket.error().message;
    EXPECT_EQ(ticket.value().estimated_completion, clock_.now() + std::chrono::minutes(60));

    clock_.advance(std::chrono::minutes(30));
    auto halfway = engine().check_retrieval_status(ticket.value().retrieval_id);
    ASSERT_TRUE(halfway.is_ok());
    EXPECT_EQ(halfway.value().state, storage::RetrievalState::InProgress);
    EXPECT_EQ(halfway.value().progress, 50);

    clock_.advance(std::chrono::minutes(30));
    EXPECT_EQ(engine().check_retrieval_status(ticket.value().retrieval_id).value().state,
              storage::RetrievalState::Ready);

    auto download = engine().download(id);
    ASSERT_TRUE(download.is_ok()) << download.error().message;
    EXPECT_EQ(slurp(*download.value().stream), "sunset pixels");
    EXPECT_EQ(download.value().file_name, "beach.jpg");

    const auto& stats = engine().metrics();
    EXPECT_EQ(stats.files_uploaded.load(), 1u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 13u);
    EXPECT_EQ(stats.retrievals_initiated.load(), 1u);
    EXPECT_EQ(stats.downloads_started.load(), 1u);
}

TEST_F(StorageEngineTest, IdenticalContentIsStoredOnce) {
    std::istringstream first("same bytes");
    std::istringstream second("same bytes");
    auto original = engine().upload(photo("a.jpg"), first);
    auto copy = engine().upload(photo("b.jpg"), second);
    ASSERT_TRUE(original.is_ok());
    ASSERT_TRUE(copy.is_ok());
    EXPECT_TRUE(copy.value().duplicate);
    EXPECT_EQ(copy.value().file_id, original.value().file_id);
    EXPECT_EQ(engine().metrics().duplicates_detected.load(), 1u);
}

TEST_F(StorageEngineTest, ChunkedVideoLandsOnFlexibleTier) {
    OpenSessionRequest request{owner_, "clip.mp4", "video/mp4", 10, clock_.now(), std::nullopt, std::nullopt};
    auto opened = engine().open_session(request);
    ASSERT_TRUE(opened.is_ok()) << opened.error().message;
    EXPECT_EQ(opened.value().total_chunks, 3u);

    const std::string content = "0123456789";
    for (std::int64_t index = 2; index >= 0; --index) {
        const auto offset = static_cast<std::size_t>(index) * 4;
        auto receipt = engine().upload_chunk(opened.value().session_id, index,
                                             bytes_of(content.substr(offset, 4)));
        ASSERT_TRUE(receipt.is_ok()) << receipt.error().message;
    }

    auto status = engine().session_status(opened.value().session_id);
    ASSERT_TRUE(status.is_ok());
    EXPECT_TRUE(status.value().complete);
    EXPECT_EQ(status.value().progress, 100);

    auto completed = engine().complete_session(opened.value().session_id);
    ASSERT_TRUE(completed.is_ok()) << completed.error().message;
    EXPECT_EQ(completed.value().location->provider_name(), "s3-glacier-flexible");
    EXPECT_EQ(engine().metrics().sessions_completed.load(), 1u);
    EXPECT_EQ(engine().metrics().chunks_received.load(), 3u);
}

TEST_F(StorageEngineTest, StaleSessionsExpire) {
    OpenSessionRequest request{owner_, "clip.mp4", "video/mp4", 10, clock_.now(), std::nullopt, std::nullopt};
    ASSERT_TRUE(engine().open_session(request).is_ok());

    clock_.advance(std::chrono::hours(25));
    auto expired = engine().expire_stale_sessions();
    ASSERT_TRUE(expired.is_ok());
    EXPECT_EQ(expired.value(), 1u);
    EXPECT_EQ(engine().metrics().sessions_expired.load(), 1u);
}

TEST_F(StorageEngineTest, ArchiveMarksFileArchived) {
    std::istringstream data("keep forever");
    auto stored = engine().upload(photo(), data);
    ASSERT_TRUE(stored.is_ok());

    ASSERT_TRUE(engine().archive(stored.value().file_id).is_ok());
    auto file = engine().store()->begin()->files().get(stored.value().file_id);
    ASSERT_TRUE(file.is_ok());
    EXPECT_TRUE(file.value()->is_archived());
    EXPECT_EQ(engine().archive(stored.value().file_id).error().kind, ErrorKind::InvalidTransition);
    EXPECT_EQ(engine().metrics().files_archived.load(), 1u);
}

TEST_F(StorageEngineTest, AsyncOperationsRunOnThePool) {
    std::vector<std::future<Result<UploadOutcome>>> pending;
    for (int i = 0; i < 8; ++i) {
        auto data = std::make_shared<std::istringstream>("async payload " + std::to_string(i));
        pending.push_back(engine().upload_async(photo("async_" + std::to_string(i) + ".jpg"), data));
    }

    std::vector<domain::FileId> ids;
    for (auto& future : pending) {
        auto outcome = future.get();
        ASSERT_TRUE(outcome.is_ok()) << outcome.error().message;
        ids.push_back(outcome.value().file_id);
    }
    EXPECT_EQ(engine().metrics().files_uploaded.load(), 8u);

    auto ticket = engine().initiate_retrieval_async(ids.front(), storage::RetrievalTier::Bulk).get();
    ASSERT_TRUE(ticket.is_ok());
    clock_.advance(std::chrono::minutes(180));

    auto download = engine().download_async(ids.front()).get();
    ASSERT_TRUE(download.is_ok()) << download.error().message;
    EXPECT_EQ(slurp(*download.value().stream), "async payload 0");

    EXPECT_TRUE(engine().archive_async(ids.back()).get().is_ok());
    EXPECT_EQ(engine().upload_async(photo(), nullptr).get().error().kind, ErrorKind::InvalidArgument);
}

TEST_F(StorageEngineTest, AsyncChunkedSession) {
    OpenSessionRequest request{owner_, "clip.mp4", "video/mp4", 8, clock_.now(), std::nullopt, std::nullopt};
    auto opened = engine().open_session(request);
    ASSERT_TRUE(opened.is_ok());

    auto first = engine().upload_chunk_async(opened.value().session_id, 0, bytes_of("abcd"));
    auto second = engine().upload_chunk_async(opened.value().session_id, 1, bytes_of("efgh"));
    ASSERT_TRUE(first.get().is_ok());
    ASSERT_TRUE(second.get().is_ok());

    auto completed = engine().complete_session_async(opened.value().session_id).get();
    ASSERT_TRUE(completed.is_ok()) << completed.error().message;
    EXPECT_FALSE(completed.value().duplicate);
}

TEST_F(StorageEngineTest, HealthReportCoversEveryProvider) {
    auto report = engine().provider_health();
    ASSERT_EQ(report.size(), 3u);
    EXPECT_EQ(report[0].provider, "s3-standard");
    for (const auto& entry : report) {
        EXPECT_TRUE(entry.status.healthy) << entry.provider << ": " << entry.status.message;
    }
}
