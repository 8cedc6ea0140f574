#include "strata/orchestration/retrieval_orchestrator.hpp"
#include "strata/orchestration/upload_orchestrator.hpp"
#include "strata/events/events.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace strata;
using namespace strata::orchestration;
using namespace strata::test_support;

class RetrievalOrchestratorTest : public ::testing::Test {
protected:
    domain::FileId store_file(const std::string& content, const std::string& mime = "image/jpeg",
                              std::optional<std::string> provider = std::nullopt) {
        FileUploadOrchestrator uploads(rig_.collaborators());
        std::istringstream data(content);
        UploadRequest request{owner_, "photo.jpg", mime, rig_.clock.now(), std::move(provider), {}};
        auto outcome = uploads.upload(request, data);
        EXPECT_TRUE(outcome.is_ok());
        return outcome.value().file_id;
    }

    domain::File fetch(const domain::FileId& id) {
        return *rig_.store->begin()->files().get(id).value();
    }

    Rig rig_;
    domain::UserId owner_ = domain::UserId::generate();
};

TEST_F(RetrievalOrchestratorTest, InitiateRequestsRestoreFromOwningProvider) {
    const auto id = store_file("cold bytes");
    RetrievalOrchestrator retrievals(rig_.collaborators());

    std::string announced;
    rig_.bus->subscribe<events::RetrievalInitiatedEvent>([&](const events::RetrievalInitiatedEvent& e) {
        announced = e.retrieval_id + "@" + e.provider + "/" + e.tier;
    });

    auto requested = retrievals.initiate_retrieval(id, storage::RetrievalTier::Bulk);
    ASSERT_TRUE(requested.is_ok()) << requested.error().message;
    EXPECT_EQ(requested.value().retrieval_id, "s3-glacier-deep-restore-0");
    EXPECT_EQ(requested.value().provider, "s3-glacier-deep");
    EXPECT_EQ(requested.value().state, storage::RetrievalState::Requested);
    EXPECT_EQ(requested.value().estimated_completion, rig_.clock.now() + std::chrono::hours(1));
    EXPECT_EQ(announced, "s3-glacier-deep-restore-0@s3-glacier-deep/Bulk");
}

TEST_F(RetrievalOrchestratorTest, StatusFollowsTheBackend) {
    const auto id = store_file("cold bytes");
    RetrievalOrchestrator retrievals(rig_.collaborators());
    const auto retrieval_id = retrievals.initiate_retrieval(id, storage::RetrievalTier::Standard).value().retrieval_id;

    auto pending = retrievals.check_status(retrieval_id);
    ASSERT_TRUE(pending.is_ok());
    EXPECT_EQ(pending.value().state, storage::RetrievalState::InProgress);
    EXPECT_EQ(pending.value().progress, 50);

    rig_.deep->finish_restores();
    auto ready = retrievals.check_status(retrieval_id);
    EXPECT_EQ(ready.value().state, storage::RetrievalState::Ready);
    EXPECT_EQ(ready.value().progress, 100);
}

TEST_F(RetrievalOrchestratorTest, StatusAsksEveryRetrievalCapableProvider) {
    const auto id = store_file("clip", "video/mp4");
    RetrievalOrchestrator retrievals(rig_.collaborators());
    const auto retrieval_id = retrievals.initiate_retrieval(id, storage::RetrievalTier::Standard).value().retrieval_id;
    EXPECT_EQ(retrieval_id, "s3-glacier-flexible-restore-0");

    auto status = retrievals.check_status(retrieval_id);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().state, storage::RetrievalState::InProgress);
    EXPECT_EQ(rig_.deep->status_queries.load(), 1);
    EXPECT_EQ(rig_.flexible->status_queries.load(), 1);
    EXPECT_EQ(rig_.standard->status_queries.load(), 0);
}

TEST_F(RetrievalOrchestratorTest, UnknownRetrievalIsReportedAsFailed) {
    RetrievalOrchestrator retrievals(rig_.collaborators());

    auto status = retrievals.check_status("restore-nobody-knows");
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().state, storage::RetrievalState::Failed);
    EXPECT_EQ(status.value().message, "Retrieval ID not found: restore-nobody-knows");

    EXPECT_EQ(retrievals.check_status("  ").error().kind, ErrorKind::InvalidArgument);
}

TEST_F(RetrievalOrchestratorTest, ColdDownloadNeedsCompletedRestore) {
    const auto id = store_file("cold bytes");
    RetrievalOrchestrator retrievals(rig_.collaborators());

    auto early = retrievals.download(id);
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error().kind, ErrorKind::RestoreRequired);

    ASSERT_TRUE(retrievals.initiate_retrieval(id, storage::RetrievalTier::Expedited).is_ok());
    rig_.deep->finish_restores();

    int downloads = 0;
    rig_.bus->subscribe<events::FileDownloadStartedEvent>([&](const events::FileDownloadStartedEvent& e) {
        downloads++;
        EXPECT_EQ(e.bytes, 10u);
    });

    auto restored = retrievals.download(id);
    ASSERT_TRUE(restored.is_ok()) << restored.error().message;
    EXPECT_EQ(slurp(*restored.value().stream), "cold bytes");
    EXPECT_EQ(restored.value().file_name, "photo.jpg");
    EXPECT_EQ(restored.value().mime_type, "image/jpeg");
    EXPECT_EQ(restored.value().size_bytes, 10u);
    EXPECT_EQ(downloads, 1);
}

TEST_F(RetrievalOrchestratorTest, HotDownloadIsImmediate) {
    const auto id = store_file("hot bytes", "image/jpeg", std::string("s3-standard"));
    RetrievalOrchestrator retrievals(rig_.collaborators());

    auto download = retrievals.download(id);
    ASSERT_TRUE(download.is_ok());
    EXPECT_EQ(slurp(*download.value().stream), "hot bytes");
}

TEST_F(RetrievalOrchestratorTest, HotProviderRefusesRetrieval) {
    const auto id = store_file("hot bytes", "image/jpeg", std::string("s3-standard"));
    RetrievalOrchestrator retrievals(rig_.collaborators());

    auto requested = retrievals.initiate_retrieval(id, storage::RetrievalTier::Standard);
    ASSERT_TRUE(requested.is_error());
    EXPECT_EQ(requested.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(RetrievalOrchestratorTest, MissingFileOrProviderIsNotFound) {
    RetrievalOrchestrator retrievals(rig_.collaborators());
    const auto unknown = domain::FileId::generate();
    EXPECT_EQ(retrievals.initiate_retrieval(unknown, storage::RetrievalTier::Standard).error().kind,
              ErrorKind::NotFound);
    EXPECT_EQ(retrievals.download(unknown).error().kind, ErrorKind::NotFound);
    EXPECT_EQ(retrievals.archive(unknown).error().kind, ErrorKind::NotFound);

    const auto id = store_file("cold bytes");
    auto without_deep = std::make_shared<storage::ProviderRegistry>();
    ASSERT_TRUE(without_deep->add(rig_.standard).is_ok());
    auto collaborators = rig_.collaborators();
    collaborators.registry = without_deep;
    RetrievalOrchestrator orphaned(collaborators);

    auto download = orphaned.download(id);
    ASSERT_TRUE(download.is_error());
    EXPECT_EQ(download.error().kind, ErrorKind::NotFound);
    EXPECT_NE(download.error().message.find("s3-glacier-deep"), std::string::npos);
}

TEST_F(RetrievalOrchestratorTest, FileWithoutLocationIsNotFound) {
    const auto now = rig_.clock.now();
    auto metadata = domain::FileMetadata::create("pending.jpg", "sha256:pending", now, now).value();
    auto pending = domain::File::create(owner_, std::move(metadata), domain::FileSize::from_bytes(5).value(),
                                        domain::FileType::from_mime_type("image/jpeg").value(), now).file;
    auto unit = rig_.store->begin();
    ASSERT_TRUE(unit->files().add(pending).is_ok());
    ASSERT_TRUE(unit->save_changes().is_ok());

    RetrievalOrchestrator retrievals(rig_.collaborators());
    EXPECT_EQ(retrievals.download(pending.id()).error().kind, ErrorKind::NotFound);
    EXPECT_EQ(retrievals.archive(pending.id()).error().kind, ErrorKind::InvalidTransition);
}

TEST_F(RetrievalOrchestratorTest, ArchiveFreezesCompletedFile) {
    const auto id = store_file("cold bytes");
    RetrievalOrchestrator retrievals(rig_.collaborators());

    int archived_events = 0;
    rig_.bus->subscribe<domain::FileArchived>([&](const domain::FileArchived& e) {
        archived_events++;
        EXPECT_EQ(e.location.provider_name(), "s3-glacier-deep");
    });

    ASSERT_TRUE(retrievals.archive(id).is_ok());
    const auto file = fetch(id);
    EXPECT_TRUE(file.is_archived());
    EXPECT_EQ(file.version(), 2u);
    EXPECT_EQ(archived_events, 1);

    auto again = retrievals.archive(id);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::InvalidTransition);

    // Archived files can still be restored and read
    ASSERT_TRUE(retrievals.initiate_retrieval(id, storage::RetrievalTier::Standard).is_ok());
    rig_.deep->finish_restores();
    EXPECT_TRUE(retrievals.download(id).is_ok());
}
