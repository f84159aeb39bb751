#include "relay/bot/command.hpp"
#include "relay/bot/replies.hpp"

#include <gtest/gtest.h>

using relay::bot::CommandKind;
using relay::bot::parse_command;
using relay::bot::to_request;

TEST(CommandParserTest, SimpleCommands) {
    EXPECT_EQ(parse_command("/start").kind, CommandKind::Start);
    EXPECT_EQ(parse_command("/help@RelayBot").kind, CommandKind::Help);
    EXPECT_EQ(parse_command("  /START  ").kind, CommandKind::Start);
    EXPECT_EQ(parse_command("/unknown").kind, CommandKind::Unknown);
    EXPECT_EQ(parse_command("hello there").kind, CommandKind::Unknown);
    EXPECT_EQ(parse_command("").kind, CommandKind::Unknown);
}

TEST(CommandParserTest, VideoCommandWithQuality) {
    const auto command = parse_command("/yt https://video.example/watch?v=1 720p");
    EXPECT_EQ(command.kind, CommandKind::Video);
    EXPECT_EQ(command.argument, "https://video.example/watch?v=1");
    EXPECT_EQ(command.option, std::optional<std::string>("720p"));

    const auto alias = parse_command("/video@RelayBot https://video.example/2");
    EXPECT_EQ(alias.kind, CommandKind::Video);
    EXPECT_FALSE(alias.option.has_value());

    EXPECT_EQ(parse_command("/yt").kind, CommandKind::Unknown);
}

TEST(CommandParserTest, BareUrlIsVideo) {
    const auto command = parse_command("HTTPS://video.example/x audio");
    EXPECT_EQ(command.kind, CommandKind::Video);
    EXPECT_EQ(command.option, std::optional<std::string>("audio"));
}

TEST(CommandParserTest, FileCommandKeepsMultiWordName) {
    const auto command = parse_command("/file /srv/inbox/doc.bin Annual   Report.pdf");
    EXPECT_EQ(command.kind, CommandKind::File);
    EXPECT_EQ(command.argument, "/srv/inbox/doc.bin");
    EXPECT_EQ(command.option, std::optional<std::string>("Annual Report.pdf"));
}

TEST(CommandParserTest, RequestsForTransferCommands) {
    auto video = to_request(parse_command("/yt https://video.example/1 4k"), std::string("folder"));
    ASSERT_TRUE(video.has_value());
    EXPECT_EQ(video->kind, relay::transfer::SourceKind::Remote);
    EXPECT_EQ(video->quality_hint, std::optional<std::string>("4k"));
    EXPECT_EQ(video->folder_hint, std::optional<std::string>("folder"));

    auto file = to_request(parse_command("/file /tmp/a.bin a.pdf"));
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->kind, relay::transfer::SourceKind::Direct);
    EXPECT_EQ(file->locator, "/tmp/a.bin");
    EXPECT_EQ(file->file_name, std::optional<std::string>("a.pdf"));

    EXPECT_FALSE(to_request(parse_command("/help")).has_value());
}

TEST(RepliesTest, ResultFormatting) {
    const auto ok = relay::transfer::TransferResult::success("r1", "clip [720p].mp4", "https://drive.example/f/1", 10);
    EXPECT_EQ(relay::bot::format_result(ok), "✅ Uploaded!\nclip [720p].mp4\nhttps://drive.example/f/1");

    const auto failed = relay::transfer::TransferResult::failed(
        "r2", relay::Error{relay::ErrorKind::Acquisition, "Video unavailable"});
    EXPECT_EQ(relay::bot::format_result(failed), "❌ Error: AcquisitionError: Video unavailable");

    EXPECT_EQ(relay::bot::downloading_text(), "⬇️ Downloading…");
    EXPECT_NE(relay::bot::welcome_text().find("send you a link back"), std::string::npos);
}
