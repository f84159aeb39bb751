#include "relay/transfer/uploader.hpp"
#include "relay/events/events.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

using relay::testing::FakeStorage;
using relay::testing::TempDir;
using relay::transfer::ProgressPhase;
using relay::transfer::ProgressReporter;
using relay::transfer::ResumableUploader;
using relay::transfer::StagedFile;
using relay::transfer::UploadCursor;

namespace {

StagedFile stage(const TempDir& dir, std::uint64_t size, const std::string& name = "report.pdf") {
    StagedFile file;
    file.path = dir.path() / name;
    relay::testing::write_sized_file(file.path, size);
    file.size = size;
    file.content_type = "application/pdf";
    return file;
}

} // namespace

TEST(UploadCursorTest, TracksForwardProgress) {
    UploadCursor cursor;
    auto first = cursor.advance(100);
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value());

    auto same = cursor.advance(100);
    ASSERT_TRUE(same.is_ok());
    EXPECT_FALSE(same.value());

    auto regress = cursor.advance(50);
    ASSERT_TRUE(regress.is_error());
    EXPECT_EQ(regress.error().kind, relay::ErrorKind::Upload);
    EXPECT_EQ(cursor.position(), 100u);
    EXPECT_EQ(cursor.acknowledged(), (std::vector<std::uint64_t>{100}));
}

TEST(ResumableUploaderTest, UploadsInChunksAndReturnsLink) {
    TempDir dir;
    FakeStorage storage;
    relay::events::EventBus bus;
    std::vector<std::uint64_t> acked;
    bus.subscribe<relay::events::UploadChunkAckedEvent>([&acked](const relay::events::UploadChunkAckedEvent& e) {
        acked.push_back(e.bytes_so_far);
    });

    const auto file = stage(dir, 2500);
    ProgressReporter progress;
    ResumableUploader uploader(storage, 1000, &bus);
    auto link = uploader.upload(file, "Q3 report.pdf", std::string("folder-1"), progress, "req-1");

    ASSERT_TRUE(link.is_ok()) << link.error().message;
    EXPECT_EQ(link.value(), "https://storage.example/d/Q3 report.pdf");
    EXPECT_EQ(acked, (std::vector<std::uint64_t>{1000, 2000, 2500}));

    ASSERT_EQ(storage.targets.size(), 1u);
    EXPECT_EQ(storage.targets[0].name, "Q3 report.pdf");
    EXPECT_EQ(storage.targets[0].parent_folder, std::optional<std::string>("folder-1"));
    EXPECT_EQ(storage.targets[0].mime_type, "application/pdf");

    const auto state = progress.snapshot();
    EXPECT_EQ(state.phase, ProgressPhase::Uploading);
    EXPECT_EQ(state.bytes, 2500u);
    EXPECT_EQ(state.total, std::optional<std::uint64_t>(2500));
}

TEST(ResumableUploaderTest, FinalChunkWithoutLinkIsUploadError) {
    TempDir dir;
    FakeStorage storage;
    storage.script.finalize_without_link = true;

    const auto file = stage(dir, 10);
    ProgressReporter progress;
    ResumableUploader uploader(storage, 1000);
    auto link = uploader.upload(file, "tiny.pdf", std::nullopt, progress);

    ASSERT_TRUE(link.is_error());
    EXPECT_EQ(link.error().kind, relay::ErrorKind::Upload);
    EXPECT_NE(link.error().message.find("without a shareable link"), std::string::npos);
}

TEST(ResumableUploaderTest, ChunkFailureIsNotRetried) {
    TempDir dir;
    FakeStorage storage;
    storage.script.fail_at_chunk = 1;

    const auto file = stage(dir, 5000);
    ProgressReporter progress;
    ResumableUploader uploader(storage, 1000);
    auto link = uploader.upload(file, "big.pdf", std::nullopt, progress);

    ASSERT_TRUE(link.is_error());
    EXPECT_EQ(link.error().kind, relay::ErrorKind::Upload);
    EXPECT_NE(link.error().message.find("chunk 1"), std::string::npos);
    EXPECT_EQ(progress.snapshot().bytes, 1000u);
}

TEST(ResumableUploaderTest, SessionCreationFailureIsUploadError) {
    TempDir dir;
    FakeStorage storage;
    storage.script.create_failure = "storageQuotaExceeded";

    const auto file = stage(dir, 10);
    ProgressReporter progress;
    ResumableUploader uploader(storage, 1000);
    auto link = uploader.upload(file, "x.pdf", std::nullopt, progress);

    ASSERT_TRUE(link.is_error());
    EXPECT_EQ(link.error().kind, relay::ErrorKind::Upload);
    EXPECT_EQ(link.error().message, "storageQuotaExceeded");
}

TEST(ResumableUploaderTest, OffsetRegressionIsUploadError) {
    TempDir dir;
    FakeStorage storage;
    storage.script.regress = true;

    const auto file = stage(dir, 3000);
    ProgressReporter progress;
    ResumableUploader uploader(storage, 1000);
    auto link = uploader.upload(file, "x.pdf", std::nullopt, progress);

    ASSERT_TRUE(link.is_error());
    EXPECT_EQ(link.error().kind, relay::ErrorKind::Upload);
}

TEST(ResumableUploaderTest, StalledUploadStops) {
    TempDir dir;
    FakeStorage storage;
    storage.script.stall = true;

    const auto file = stage(dir, 3000);
    ProgressReporter progress;
    ResumableUploader uploader(storage, 1000);
    auto link = uploader.upload(file, "x.pdf", std::nullopt, progress);

    ASSERT_TRUE(link.is_error());
    EXPECT_NE(link.error().message.find("stalled"), std::string::npos);
}
