#include "relay/transfer/staging.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using relay::testing::TempDir;
using relay::transfer::StagingArea;

TEST(StagingAreaTest, CreatesUniqueDirectoriesPerRequest) {
    TempDir root;
    auto first = StagingArea::create(root.path(), "req-1");
    auto second = StagingArea::create(root.path(), "req-1");
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_TRUE(fs::is_directory(first.value()->path()));
    EXPECT_NE(first.value()->path(), second.value()->path());
    EXPECT_EQ(first.value()->path().parent_path(), root.path());
}

TEST(StagingAreaTest, DestroyRemovesContentsOnce) {
    TempDir root;
    auto created = StagingArea::create(root.path(), "req/../odd id");
    ASSERT_TRUE(created.is_ok());
    auto& area = *created.value();

    relay::testing::write_file(area.path() / "partial.part", "abc");
    relay::testing::write_file(area.path() / "nested" / "frag.ts", "def");

    EXPECT_TRUE(area.destroy().is_ok());
    EXPECT_TRUE(area.destroyed());
    EXPECT_FALSE(fs::exists(area.path()));
    EXPECT_TRUE(area.destroy().is_ok());
    EXPECT_EQ(relay::testing::count_entries(root.path()), 0u);
}

TEST(StagingAreaTest, DestructorCleansUp) {
    TempDir root;
    fs::path created_path;
    {
        auto created = StagingArea::create(root.path(), "scoped");
        ASSERT_TRUE(created.is_ok());
        created_path = created.value()->path();
        relay::testing::write_file(created_path / "video.mp4", "data");
    }
    EXPECT_FALSE(fs::exists(created_path));
}

TEST(StagingAreaTest, UnusableRootIsStagingError) {
    TempDir root;
    const fs::path blocker = root.path() / "not_a_dir";
    relay::testing::write_file(blocker, "file in the way");

    auto created = StagingArea::create(blocker, "req");
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, relay::ErrorKind::Staging);
}
