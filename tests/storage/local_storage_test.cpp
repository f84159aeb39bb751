#include "relay/storage/local_storage.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>

namespace fs = std::filesystem;
using relay::storage::LocalStorageClient;
using relay::storage::UploadTarget;
using relay::testing::TempDir;

namespace {

UploadTarget target_for(const fs::path& file, const std::string& name,
                        std::optional<std::string> folder = std::nullopt) {
    UploadTarget target;
    target.name = name;
    target.parent_folder = std::move(folder);
    target.mime_type = "text/plain";
    target.local_path = file;
    return target;
}

// Drives a session to completion and returns the last status
relay::Result<relay::storage::ChunkStatus> drain(relay::storage::UploadSession& session,
                                                 std::vector<std::uint64_t>& offsets) {
    while (true) {
        auto status = session.next_chunk();
        if (status.is_error() || status.value().is_final) {
            if (status.is_ok()) {
                offsets.push_back(status.value().bytes_so_far);
            }
            return status;
        }
        offsets.push_back(status.value().bytes_so_far);
    }
}

} // namespace

TEST(LocalStorageTest, ChunkedUploadMaterializesObject) {
    TempDir source_dir;
    TempDir root;
    const auto file = source_dir.path() / "notes.txt";
    const std::string content =
        "Lorem ipsum dolor sit amet, consectetur adipiscing elit. Sed do eiusmod tempor incididunt.";
    relay::testing::write_file(file, content);

    LocalStorageClient storage(root.path());
    auto session = storage.create_resumable_upload(target_for(file, "Meeting notes.txt", "team"), 32);
    ASSERT_TRUE(session.is_ok()) << session.error().message;

    std::vector<std::uint64_t> offsets;
    auto last = drain(*session.value(), offsets);
    ASSERT_TRUE(last.is_ok()) << last.error().message;
    ASSERT_TRUE(last.value().link.has_value());

    EXPECT_EQ(offsets, (std::vector<std::uint64_t>{32, 64, static_cast<std::uint64_t>(content.size())}));
    const auto stored = root.path() / "team" / "Meeting notes.txt";
    EXPECT_EQ(relay::testing::read_file(stored), content);
    EXPECT_EQ(last.value().link->rfind("file://", 0), 0u);
    EXPECT_NE(last.value().link->find("Meeting%20notes.txt"), std::string::npos);
}

TEST(LocalStorageTest, NameCollisionGetsNumericSuffix) {
    TempDir source_dir;
    TempDir root;
    const auto file = source_dir.path() / "a.txt";
    relay::testing::write_file(file, "first");

    LocalStorageClient storage(root.path());
    for (int i = 0; i < 3; ++i) {
        auto session = storage.create_resumable_upload(target_for(file, "report.txt"), 1024);
        ASSERT_TRUE(session.is_ok());
        std::vector<std::uint64_t> offsets;
        ASSERT_TRUE(drain(*session.value(), offsets).is_ok());
    }

    EXPECT_TRUE(fs::exists(root.path() / "report.txt"));
    EXPECT_TRUE(fs::exists(root.path() / "report (1).txt"));
    EXPECT_TRUE(fs::exists(root.path() / "report (2).txt"));
}

TEST(LocalStorageTest, ConcurrentSameNameUploadsKeepEveryObject) {
    constexpr int kUploads = 8;
    TempDir source_dir;
    TempDir root;
    LocalStorageClient storage(root.path());

    std::vector<std::string> contents;
    for (int i = 0; i < kUploads; ++i) {
        contents.push_back("payload number " + std::to_string(i) + std::string(static_cast<std::size_t>(i) * 37, 'x'));
        relay::testing::write_file(source_dir.path() / ("src" + std::to_string(i)), contents.back());
    }

    for (int round = 0; round < 20; ++round) {
        const std::string folder = "round" + std::to_string(round);
        std::vector<std::string> links(kUploads);
        std::vector<std::thread> workers;
        for (int i = 0; i < kUploads; ++i) {
            workers.emplace_back([&, i] {
                auto session = storage.create_resumable_upload(
                    target_for(source_dir.path() / ("src" + std::to_string(i)), "same.bin", folder), 16);
                if (session.is_error()) {
                    return;
                }
                std::vector<std::uint64_t> offsets;
                auto last = drain(*session.value(), offsets);
                if (last.is_ok() && last.value().link) {
                    links[static_cast<std::size_t>(i)] = *last.value().link;
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        std::set<std::string> unique_links(links.begin(), links.end());
        EXPECT_EQ(unique_links.size(), static_cast<std::size_t>(kUploads));
        EXPECT_EQ(unique_links.count(""), 0u);

        std::multiset<std::string> stored;
        for (const auto& entry : fs::directory_iterator(root.path() / folder)) {
            stored.insert(relay::testing::read_file(entry.path()));
        }
        EXPECT_EQ(stored, std::multiset<std::string>(contents.begin(), contents.end()));
    }
}

TEST(LocalStorageTest, ChunkHashMatchesKnownDigests) {
    EXPECT_EQ(relay::storage::fnv1a_hex({}), "cbf29ce484222325");
    EXPECT_EQ(relay::storage::fnv1a_hex({'a'}), "af63dc4c8601ec8c");
}

TEST(LocalStorageTest, EmptyFileFinalizesImmediately) {
    TempDir source_dir;
    TempDir root;
    const auto file = source_dir.path() / "empty.bin";
    relay::testing::write_file(file, "");

    LocalStorageClient storage(root.path());
    auto session = storage.create_resumable_upload(target_for(file, "empty.bin"), 16);
    ASSERT_TRUE(session.is_ok());

    auto status = session.value()->next_chunk();
    ASSERT_TRUE(status.is_ok()) << status.error().message;
    EXPECT_TRUE(status.value().is_final);
    EXPECT_EQ(status.value().bytes_so_far, 0u);
    EXPECT_TRUE(fs::exists(root.path() / "empty.bin"));
}

TEST(LocalStorageTest, AbandonedSessionLeavesNoPartialData) {
    TempDir source_dir;
    TempDir root;
    const auto file = source_dir.path() / "big.bin";
    relay::testing::write_sized_file(file, 4096);

    LocalStorageClient storage(root.path());
    {
        auto session = storage.create_resumable_upload(target_for(file, "big.bin"), 1024);
        ASSERT_TRUE(session.is_ok());
        ASSERT_TRUE(session.value()->next_chunk().is_ok());
    }
    EXPECT_FALSE(fs::exists(root.path() / "big.bin"));
    EXPECT_EQ(relay::testing::count_entries(root.path() / ".uploads"), 0u);
}

TEST(LocalStorageTest, MissingSourceIsUploadError) {
    TempDir root;
    LocalStorageClient storage(root.path());
    auto session = storage.create_resumable_upload(target_for(root.path() / "nope.bin", "nope.bin"), 16);
    ASSERT_TRUE(session.is_error());
    EXPECT_EQ(session.error().kind, relay::ErrorKind::Upload);
}

TEST(LocalStorageTest, FolderNamesCannotEscapeRoot) {
    TempDir source_dir;
    TempDir root;
    const auto file = source_dir.path() / "x.txt";
    relay::testing::write_file(file, "x");

    LocalStorageClient storage(root.path());
    auto session = storage.create_resumable_upload(target_for(file, "../x.txt", std::string("../../etc")), 16);
    ASSERT_TRUE(session.is_ok());
    std::vector<std::uint64_t> offsets;
    ASSERT_TRUE(drain(*session.value(), offsets).is_ok());

    EXPECT_TRUE(fs::exists(root.path() / ".._.._etc" / ".._x.txt"));
}

TEST(LocalStorageTest, FileUriEscapesReservedCharacters) {
    EXPECT_EQ(relay::storage::file_uri("/data/a b#1.txt"), "file:///data/a%20b%231.txt");
}
