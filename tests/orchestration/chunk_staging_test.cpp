#include "strata/orchestration/chunk_staging.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace strata;
using strata::orchestration::ChunkStaging;
using strata::test_support::bytes_of;
using strata::test_support::create_temp_dir;
using strata::test_support::slurp;

class ChunkStagingTest : public ::testing::Test {
protected:
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(staging_.root(), ec);
    }

    ChunkStaging staging_{create_temp_dir("strata_staging_test")};
    domain::UploadSessionId session_ = domain::UploadSessionId::generate();
};

TEST_F(ChunkStagingTest, CreatePreSizesFile) {
    ASSERT_TRUE(staging_.create(session_, 10).is_ok());
    EXPECT_TRUE(staging_.exists(session_));
    EXPECT_EQ(std::filesystem::file_size(staging_.root() / session_.str() / "data.part"), 10u);
}

TEST_F(ChunkStagingTest, ChunksLandAtTheirOffsets) {
    ASSERT_TRUE(staging_.create(session_, 10).is_ok());
    ASSERT_TRUE(staging_.write_chunk(session_, 8, bytes_of("89")).is_ok());
    ASSERT_TRUE(staging_.write_chunk(session_, 0, bytes_of("0123")).is_ok());
    ASSERT_TRUE(staging_.write_chunk(session_, 4, bytes_of("4567")).is_ok());
    ASSERT_TRUE(staging_.write_chunk(session_, 4, bytes_of("4567")).is_ok());

    auto assembled = staging_.open(session_);
    ASSERT_TRUE(assembled.is_ok());
    EXPECT_EQ(slurp(*assembled.value()), "0123456789");
}

TEST_F(ChunkStagingTest, MissingSessionIsNotFound) {
    EXPECT_FALSE(staging_.exists(session_));
    EXPECT_EQ(staging_.write_chunk(session_, 0, bytes_of("x")).error().kind, ErrorKind::NotFound);
    EXPECT_EQ(staging_.open(session_).error().kind, ErrorKind::NotFound);
}

TEST_F(ChunkStagingTest, DiscardIsIdempotent) {
    ASSERT_TRUE(staging_.create(session_, 4).is_ok());
    EXPECT_TRUE(staging_.discard(session_).is_ok());
    EXPECT_FALSE(staging_.exists(session_));
    EXPECT_FALSE(std::filesystem::exists(staging_.root() / session_.str()));
    EXPECT_TRUE(staging_.discard(session_).is_ok());
}
