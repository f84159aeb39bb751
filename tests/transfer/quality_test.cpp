#include "relay/transfer/quality.hpp"

#include <gtest/gtest.h>

using relay::transfer::QualityCatalog;
using relay::transfer::infer_rung;
using relay::transfer::rank_qualities;
using relay::transfer::resolve_quality;

namespace {

QualityCatalog catalog_with(std::vector<std::string> qualities) {
    QualityCatalog catalog;
    catalog.title = "Sample";
    catalog.qualities = std::move(qualities);
    return catalog;
}

} // namespace

TEST(QualityLadderTest, RankMapsHeightsToUniqueRungs) {
    const auto ranked = rank_qualities({144, 360, 720, 1080, 1088, 480, 2304, 240});
    const std::vector<std::string> expected{"2160p", "1080p", "720p", "480p", "360p"};
    EXPECT_EQ(ranked, expected);
}

TEST(QualityLadderTest, NamedRungSelectsExactMatch) {
    const auto catalog = catalog_with({"1080p", "720p", "480p", "360p"});
    const auto selection = resolve_quality(std::string("720p"), catalog, 1080);

    EXPECT_EQ(selection.label, "720p");
    ASSERT_TRUE(selection.max_height.has_value());
    EXPECT_LE(*selection.max_height, 720);
    EXPECT_NE(selection.selector.find("[height<=720]"), std::string::npos);
    EXPECT_FALSE(selection.audio_only);
    EXPECT_EQ(selection.merge_container, std::optional<std::string>("mp4"));
}

TEST(QualityLadderTest, MissingRungFallsBackToNextLower) {
    const auto catalog = catalog_with({"1080p", "720p", "480p", "360p"});

    const auto from_4k = resolve_quality(std::string("2160p"), catalog, 1080);
    EXPECT_EQ(from_4k.label, "1080p");
    EXPECT_EQ(from_4k.max_height, std::optional<int>(1080));

    const auto sparse = catalog_with({"1080p", "360p"});
    EXPECT_EQ(resolve_quality(std::string("720p"), sparse, 1080).label, "360p");
}

TEST(QualityLadderTest, HintsAreCaseInsensitiveAndAcceptAliases) {
    const auto catalog = catalog_with({"2160p", "1440p", "1080p"});
    EXPECT_EQ(resolve_quality(std::string(" 4k "), catalog, 2160).label, "2160p");
    EXPECT_EQ(resolve_quality(std::string("2K"), catalog, 2160).label, "1440p");
    EXPECT_EQ(resolve_quality(std::string("1080"), catalog, 2160).label, "1080p");
}

TEST(QualityLadderTest, AudioHintSelectsAudioOnly) {
    const auto selection = resolve_quality(std::string("AUDIO"), catalog_with({"720p"}), 1080);
    EXPECT_TRUE(selection.audio_only);
    EXPECT_EQ(selection.selector, "bestaudio");
    EXPECT_EQ(selection.label, "audio");
    EXPECT_FALSE(selection.merge_container.has_value());
}

TEST(QualityLadderTest, UnknownHintBehavesAsBestUnderCeiling) {
    const auto catalog = catalog_with({"2160p", "1080p", "720p"});
    const auto selection = resolve_quality(std::string("potato"), catalog, 1080);

    EXPECT_EQ(selection.label, "1080p");
    EXPECT_EQ(selection.selector, "bestvideo[height<=1080]+bestaudio/best[height<=1080]/best");

    const auto defaulted = resolve_quality(std::nullopt, catalog_with({}), 1080);
    EXPECT_EQ(defaulted.label, "best");
    EXPECT_EQ(defaulted.max_height, std::optional<int>(1080));
}

TEST(QualityLadderTest, RungBelowEverythingOfferedUsesBest) {
    const auto catalog = catalog_with({"1080p", "720p"});
    const auto selection = resolve_quality(std::string("360p"), catalog, 1080);
    EXPECT_EQ(selection.label, "1080p");
    EXPECT_NE(selection.selector.find("[height<=1080]"), std::string::npos);
}

TEST(QualityLadderTest, InferRungFromFileName) {
    EXPECT_EQ(infer_rung("Talk [id].1080p.mp4"), std::optional<std::string>("1080p"));
    EXPECT_EQ(infer_rung("Trailer 4K HDR.webm"), std::optional<std::string>("2160p"));
    EXPECT_EQ(infer_rung("clip [dQw4kWgXcQ].mp4"), std::nullopt);
    EXPECT_EQ(infer_rung("plain.mp4"), std::nullopt);
}
