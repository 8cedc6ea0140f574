#include "strata/domain/storage_location.hpp"

#include <gtest/gtest.h>

using strata::ErrorKind;
using strata::domain::StorageLocation;

TEST(StorageLocationTest, TrimsBothParts) {
    auto location = StorageLocation::create("  s3-standard ", " photos/a.jpg\n");
    ASSERT_TRUE(location.is_ok());
    EXPECT_EQ(location.value().provider_name(), "s3-standard");
    EXPECT_EQ(location.value().path(), "photos/a.jpg");
    EXPECT_EQ(location.value().to_string(), "s3-standard:photos/a.jpg");
}

TEST(StorageLocationTest, RejectsBlankParts) {
    auto no_provider = StorageLocation::create(" ", "a");
    ASSERT_TRUE(no_provider.is_error());
    EXPECT_EQ(no_provider.error().kind, ErrorKind::InvalidArgument);

    auto no_path = StorageLocation::create("p", "");
    ASSERT_TRUE(no_path.is_error());
    EXPECT_EQ(no_path.error().kind, ErrorKind::InvalidArgument);
}

TEST(StorageLocationTest, EqualityUsesBothFields) {
    auto a = StorageLocation::create("p", "x").value();
    EXPECT_EQ(a, StorageLocation::create("p", "x").value());
    EXPECT_NE(a, StorageLocation::create("q", "x").value());
    EXPECT_NE(a, StorageLocation::create("p", "y").value());
}
