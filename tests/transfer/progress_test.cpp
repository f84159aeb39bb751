#include "relay/transfer/progress.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using relay::transfer::ProgressOptions;
using relay::transfer::ProgressPhase;
using relay::transfer::ProgressReporter;
using relay::transfer::ProgressUpdate;
using relay::testing::FakeClock;

namespace {

ProgressUpdate downloading(std::uint64_t bytes, std::optional<std::uint64_t> total = std::nullopt) {
    ProgressUpdate update;
    update.phase = ProgressPhase::Downloading;
    update.bytes = bytes;
    update.total = total;
    return update;
}

ProgressUpdate uploading(std::uint64_t bytes, std::optional<std::uint64_t> total = std::nullopt) {
    ProgressUpdate update;
    update.phase = ProgressPhase::Uploading;
    update.bytes = bytes;
    update.total = total;
    return update;
}

class ProgressReporterTest : public ::testing::Test {
protected:
    ProgressReporterTest()
        : reporter_(ProgressOptions{3000ms, 20}, [this] { return clock_.now(); }) {}

    relay::transfer::ProgressSink capture() {
        return [this](const std::string& text) {
            messages_.push_back(text);
            return relay::Ok();
        };
    }

    FakeClock clock_;
    ProgressReporter reporter_;
    std::vector<std::string> messages_;
};

} // namespace

TEST_F(ProgressReporterTest, NothingEmittedBeforeFirstByte) {
    ProgressUpdate total_only;
    total_only.total = 1000;
    reporter_.record(total_only);

    EXPECT_FALSE(reporter_.maybe_emit(capture()));
    EXPECT_TRUE(messages_.empty());
    EXPECT_EQ(reporter_.emission_count(), 0u);
}

TEST_F(ProgressReporterTest, CooldownAllowsOneEmissionPerWindow) {
    reporter_.record(downloading(100, 1000));
    EXPECT_TRUE(reporter_.maybe_emit(capture()));

    clock_.advance(1000ms);
    reporter_.record(downloading(200, 1000));
    EXPECT_FALSE(reporter_.maybe_emit(capture()));
    EXPECT_EQ(messages_.size(), 1u);

    clock_.advance(2000ms);
    EXPECT_TRUE(reporter_.maybe_emit(capture()));
    EXPECT_FALSE(reporter_.maybe_emit(capture()));
    EXPECT_EQ(messages_.size(), 2u);
}

TEST_F(ProgressReporterTest, UnchangedStateIsNotReEmitted) {
    reporter_.record(downloading(100, 1000));
    EXPECT_TRUE(reporter_.maybe_emit(capture()));

    clock_.advance(10s);
    EXPECT_FALSE(reporter_.maybe_emit(capture()));

    reporter_.record(downloading(500, 1000));
    EXPECT_TRUE(reporter_.maybe_emit(capture()));
    EXPECT_EQ(reporter_.emission_count(), 2u);
}

TEST_F(ProgressReporterTest, BytesNeverDecreaseWithinPhase) {
    reporter_.record(downloading(500));
    reporter_.record(downloading(200));
    EXPECT_EQ(reporter_.snapshot().bytes, 500u);

    reporter_.record(downloading(700));
    EXPECT_EQ(reporter_.snapshot().bytes, 700u);
}

TEST_F(ProgressReporterTest, PhaseMovesForwardOnlyOnce) {
    reporter_.record(downloading(900, 900));
    EXPECT_TRUE(reporter_.record(uploading(100, 900)));

    auto state = reporter_.snapshot();
    EXPECT_EQ(state.phase, ProgressPhase::Uploading);
    EXPECT_EQ(state.bytes, 100u);

    EXPECT_FALSE(reporter_.record(downloading(50)));
    state = reporter_.snapshot();
    EXPECT_EQ(state.phase, ProgressPhase::Uploading);
    EXPECT_EQ(state.bytes, 100u);
}

TEST_F(ProgressReporterTest, SpeedEstimatedWhenNotReported) {
    reporter_.record(downloading(0));
    clock_.advance(2000ms);
    reporter_.record(downloading(4096));

    const auto state = reporter_.snapshot();
    ASSERT_TRUE(state.speed.has_value());
    EXPECT_DOUBLE_EQ(*state.speed, 2048.0);
}

TEST_F(ProgressReporterTest, SinkFailureIsSwallowed) {
    reporter_.record(downloading(10, 100));
    EXPECT_TRUE(reporter_.maybe_emit([](const std::string&) {
        return relay::Err<void>(relay::Error{relay::ErrorKind::Upload, "message not modified"});
    }));

    clock_.advance(5s);
    reporter_.record(downloading(20, 100));
    EXPECT_NO_THROW(reporter_.maybe_emit([](const std::string&) -> relay::Result<void> {
        throw std::runtime_error("flood wait");
    }));
    EXPECT_EQ(reporter_.emission_count(), 2u);
}

TEST_F(ProgressReporterTest, SnapshotTextShowsPhaseQualityAndBar) {
    ProgressUpdate update = downloading(400, 1000);
    update.quality = "720p";
    update.speed = 100.0;
    reporter_.record(update);
    ASSERT_TRUE(reporter_.maybe_emit(capture()));

    const auto& text = messages_.front();
    EXPECT_NE(text.find("Downloading (720p)"), std::string::npos);
    EXPECT_NE(text.find("40.0%"), std::string::npos);
    EXPECT_NE(text.find("400 B / 1000 B"), std::string::npos);
    EXPECT_NE(text.find("Speed: 100 B/s | ETA: 6s"), std::string::npos);
}

TEST(ProgressFormatTest, Bytes) {
    EXPECT_EQ(relay::transfer::format_bytes(0), "0 B");
    EXPECT_EQ(relay::transfer::format_bytes(1023), "1023 B");
    EXPECT_EQ(relay::transfer::format_bytes(1536), "1.50 KB");
    EXPECT_EQ(relay::transfer::format_bytes(50'000'000), "47.68 MB");
    EXPECT_EQ(relay::transfer::format_bytes(3ULL * 1024 * 1024 * 1024), "3.00 GB");
}

TEST(ProgressFormatTest, Durations) {
    EXPECT_EQ(relay::transfer::format_duration(std::chrono::seconds(45)), "45s");
    EXPECT_EQ(relay::transfer::format_duration(std::chrono::seconds(185)), "3m 05s");
    EXPECT_EQ(relay::transfer::format_duration(std::chrono::seconds(3720)), "1h 02m");
}

TEST(ProgressFormatTest, BarFillsProportionally) {
    EXPECT_EQ(relay::transfer::render_bar(0.5, 4), "[██░░]");
    EXPECT_EQ(relay::transfer::render_bar(2.0, 2), "[██]");
    EXPECT_EQ(relay::transfer::render_bar(-1.0, 2), "[░░]");
}

TEST(ProgressFormatTest, UnknownTotalShowsRunningCount) {
    relay::transfer::ProgressState state;
    state.phase = ProgressPhase::Uploading;
    state.bytes = 2048;
    const auto text = relay::transfer::render_snapshot(state, 20);
    EXPECT_NE(text.find("Uploading"), std::string::npos);
    EXPECT_NE(text.find("2.00 KB uploaded"), std::string::npos);
    EXPECT_EQ(text.find('%'), std::string::npos);
}
