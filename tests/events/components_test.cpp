#include "relay/events/components.hpp"

#include <gtest/gtest.h>

using namespace relay::events;
using relay::transfer::SourceKind;
using relay::transfer::TransferState;

TEST(MetricsComponent, CountsTransferLifecycle) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(TransferStartedEvent{"a", SourceKind::Direct, "h1"});
    bus.emit(TransferStartedEvent{"b", SourceKind::Remote, "https://v.example/b"});
    bus.emit(SourceStagedEvent{"a", "doc.pdf", 1200});
    bus.emit(UploadChunkAckedEvent{"a", "doc.pdf", 0, 1000, 1200});
    bus.emit(UploadChunkAckedEvent{"a", "doc.pdf", 1, 1200, 1200});
    bus.emit(TransferCompletedEvent{"a", "doc.pdf", "https://storage.example/doc", 1200});
    bus.emit(TransferFailedEvent{"b", relay::Error{relay::ErrorKind::Acquisition, "gone"}, TransferState::Acquiring});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.transfers_started.load(), 2u);
    EXPECT_EQ(stats.transfers_completed.load(), 1u);
    EXPECT_EQ(stats.transfers_failed.load(), 1u);
    EXPECT_EQ(stats.bytes_staged.load(), 1200u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 1200u);
    EXPECT_EQ(stats.chunks_acked.load(), 2u);
}

TEST(LoggerComponent, SubscribesToEveryLifecycleEvent) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_EQ(bus.subscriber_count<TransferStartedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferStateChangedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<SourceStagedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<UploadChunkAckedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferCompletedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferFailedEvent>(), 1u);

    EXPECT_NO_THROW(bus.emit(TransferFailedEvent{"x", relay::Error{relay::ErrorKind::Upload, "denied"},
                                                 TransferState::Uploading}));
}
