#include "upo/events/components.hpp"
#include "upo/events/event_bus.hpp"
#include "upo/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace upo::events;
using upo::upload::FileStatus;
using upo::upload::StatusCategory;

TEST(MetricsComponentTest, TracksUploadOutcomes) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(EntrySubmittedEvent{"file-1", "a.jpg", 1000, "image/jpeg", "h1"});
    bus.emit(EntrySubmittedEvent{"file-2", "b.jpg", 500, "image/jpeg", "h2"});
    bus.emit(UploadSucceededEvent{"file-1", "a.jpg", "https://cdn/a", "a", 800, std::chrono::milliseconds(20)});
    bus.emit(UploadFailedEvent{"file-2", "b.jpg", "boom", StatusCategory::ServerError});
    bus.emit(EntryRequeuedEvent{"file-1", RequeueReason::RateLimited, 1, std::chrono::seconds(30)});
    bus.emit(EntryRequeuedEvent{"file-2", RequeueReason::Network, 1, std::chrono::seconds(2)});
    bus.emit(CompressionFallbackEvent{"file-1", "a.jpg", "codec unavailable"});
    bus.emit(PipelinePausedEvent{"Rate limited. Resuming in 30 seconds...", std::chrono::seconds(30)});
    bus.emit(EntryRemovedEvent{"file-2", FileStatus::Error});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_submitted.load(), 2u);
    EXPECT_EQ(stats.bytes_submitted.load(), 1500u);
    EXPECT_EQ(stats.files_uploaded.load(), 1u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 800u);
    EXPECT_EQ(stats.files_failed.load(), 1u);
    EXPECT_EQ(stats.rate_limit_requeues.load(), 1u);
    EXPECT_EQ(stats.network_requeues.load(), 1u);
    EXPECT_EQ(stats.compression_fallbacks.load(), 1u);
    EXPECT_EQ(stats.pauses.load(), 1u);
    EXPECT_EQ(stats.files_removed.load(), 1u);
}

TEST(ComponentsTest, DetachFromBusWhenDestroyed) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        MetricsComponent metrics(bus);
        EXPECT_EQ(bus.subscriber_count<UploadSucceededEvent>(), 2u);
        EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 1u);
    }
    EXPECT_EQ(bus.subscriber_count<UploadSucceededEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 0u);

    // Emitting after the components are gone must not touch them
    EXPECT_NO_THROW(bus.emit(UploadSucceededEvent{"file-1", "a", "u", "k", 1, std::chrono::milliseconds(1)}));
}

TEST(NotificationChannelTest, QueuesSuccessAndFailureNotices) {
    EventBus bus;
    NotificationChannel channel(bus);

    bus.emit(UploadSucceededEvent{"file-1", "a.jpg", "https://cdn/a.jpg", "a", 10, std::chrono::milliseconds(5)});
    bus.emit(UploadProgressEvent{"file-2", 50});
    bus.emit(UploadFailedEvent{"file-2", "b.jpg", "File too large", StatusCategory::ClientError});

    ASSERT_EQ(channel.queue().size(), 2u);

    auto first = channel.queue().try_pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->kind, Notification::Kind::Success);
    EXPECT_EQ(first->entry_id, "file-1");
    EXPECT_EQ(first->detail, "https://cdn/a.jpg");

    auto second = channel.queue().try_pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->kind, Notification::Kind::Failure);
    EXPECT_EQ(second->name, "b.jpg");
    EXPECT_EQ(second->detail, "File too large");
}

TEST(LoggerComponentTest, HandlesEveryEventWithoutThrowing) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_NO_THROW({
        bus.emit(EntrySubmittedEvent{"file-1", "a.jpg", 1, "image/jpeg", "h"});
        bus.emit(EntryStartedEvent{"file-1", "a.jpg", FileStatus::Compressing});
        bus.emit(UploadProgressEvent{"file-1", 10});
        bus.emit(UploadFailedEvent{"file-1", "a.jpg", "timed out", std::nullopt});
        bus.emit(EntryRequeuedEvent{"file-1", RequeueReason::Network, 1, std::chrono::seconds(2)});
        bus.emit(PipelineResumedEvent{std::chrono::seconds(3)});
    });
}
