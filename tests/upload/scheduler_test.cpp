#include "upo/events/components.hpp"
#include "upo/events/event_bus.hpp"
#include "upo/events/events.hpp"
#include "upo/upload/scheduler.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>

using namespace std::chrono_literals;

using upo::config::SchedulerConfig;
using upo::events::EventBus;
using upo::test_support::FakeCompression;
using upo::test_support::FakeTransport;
using upo::test_support::make_file;
using upo::test_support::transport_error;
using upo::upload::EntryId;
using upo::upload::FileEntry;
using upo::upload::FileStatus;
using upo::upload::StatusCategory;
using upo::upload::UploadScheduler;

namespace {

SchedulerConfig make_config(std::uint32_t max_concurrent = 2) {
    SchedulerConfig config;
    config.max_concurrent = max_concurrent;
    config.upload.entity_type = "property";
    config.upload.entity_id = "prop-1";
    config.initial_backoff = 20ms;
    config.max_backoff = 100ms;
    return config;
}

bool eventually(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

std::vector<upo::upload::SourceFile> make_batch(int count, std::size_t size = 1024) {
    std::vector<upo::upload::SourceFile> files;
    for (int i = 0; i < count; ++i) {
        files.push_back(make_file("doc-" + std::to_string(i) + ".pdf", size, "application/pdf",
                                  static_cast<std::uint8_t>(i)));
    }
    return files;
}

FileEntry entry_of(const UploadScheduler& scheduler, const EntryId& id) {
    auto entry = scheduler.find(id);
    EXPECT_TRUE(entry.has_value()) << "missing entry " << id;
    return entry.value_or(FileEntry{});
}

} // namespace

class UploadSchedulerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    EventBus bus;
};

// ════════════════════════════════════════════════════════
// Concurrency
// ════════════════════════════════════════════════════════

TEST_F(UploadSchedulerTest, FiveFilesWithTwoSlotsStartTwoAndDrainInOrder) {
    transport->set_gated(true);
    UploadScheduler scheduler(make_config(2), transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(5));
    ASSERT_EQ(ids.size(), 5u);

    auto counts = scheduler.counts();
    EXPECT_EQ(counts.uploading, 2u);
    EXPECT_EQ(counts.pending, 3u);
    EXPECT_EQ(scheduler.active_count(), 2u);
    EXPECT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Uploading);
    EXPECT_EQ(entry_of(scheduler, ids[1]).status, FileStatus::Uploading);
    EXPECT_EQ(entry_of(scheduler, ids[2]).status, FileStatus::Pending);

    transport->release(1);
    ASSERT_TRUE(eventually([&] { return scheduler.counts().success == 1; }));
    ASSERT_TRUE(eventually([&] { return scheduler.counts().uploading == 2; }));
    EXPECT_EQ(scheduler.counts().pending, 2u);
    EXPECT_EQ(entry_of(scheduler, ids[2]).status, FileStatus::Uploading);

    transport->release(4);
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    counts = scheduler.counts();
    EXPECT_EQ(counts.success, 5u);
    EXPECT_EQ(counts.pending, 0u);
    EXPECT_EQ(scheduler.active_count(), 0u);
    EXPECT_LE(transport->max_in_flight(), 2);
}

TEST_F(UploadSchedulerTest, NeverExceedsConcurrencyCeiling) {
    std::atomic<std::size_t> worst{0};
    UploadScheduler scheduler(make_config(3), transport, nullptr, bus);

    bus.subscribe<upo::events::EntryStartedEvent>([&](const upo::events::EntryStartedEvent&) {
        const auto active = scheduler.counts().active();
        std::size_t seen = worst.load();
        while (active > seen && !worst.compare_exchange_weak(seen, active)) {
        }
    });

    scheduler.submit(make_batch(12));
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    EXPECT_EQ(scheduler.counts().success, 12u);
    EXPECT_LE(worst.load(), 3u);
    EXPECT_LE(transport->max_in_flight(), 3);
}

TEST_F(UploadSchedulerTest, SuccessfulEntryCarriesUrlKeyAndFullProgress) {
    std::vector<int> progress;
    std::mutex progress_mutex;
    bus.subscribe<upo::events::UploadProgressEvent>([&](const upo::events::UploadProgressEvent& e) {
        std::lock_guard lock(progress_mutex);
        progress.push_back(e.progress);
    });

    UploadScheduler scheduler(make_config(), transport, nullptr, bus);
    auto ids = scheduler.submit({make_file("lease.pdf", 2048)});
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    const FileEntry entry = entry_of(scheduler, ids[0]);
    EXPECT_EQ(entry.status, FileStatus::Success);
    EXPECT_EQ(entry.progress, 100);
    EXPECT_EQ(entry.uploaded_url.value_or(""), "https://cdn.test/lease.pdf");
    EXPECT_EQ(entry.uploaded_key.value_or(""), "uploads/lease.pdf");
    EXPECT_FALSE(entry.error.has_value());

    std::lock_guard lock(progress_mutex);
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));

    auto calls = transport->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].metadata.entity_type, "property");
    EXPECT_EQ(calls[0].metadata.entity_id, "prop-1");
}

TEST_F(UploadSchedulerTest, SubmitTagsEntriesWithContentDigest) {
    UploadScheduler scheduler(make_config(), transport, nullptr, bus);
    auto ids = scheduler.submit({make_file("a.pdf", 64, "application/pdf", 7),
                                 make_file("b.pdf", 64, "application/pdf", 7),
                                 make_file("c.pdf", 64, "application/pdf", 8)});

    auto a = entry_of(scheduler, ids[0]);
    auto b = entry_of(scheduler, ids[1]);
    auto c = entry_of(scheduler, ids[2]);
    ASSERT_TRUE(a.content_hash.has_value());
    EXPECT_EQ(a.content_hash->size(), 64u);
    EXPECT_EQ(a.content_hash, b.content_hash);
    EXPECT_NE(a.content_hash, c.content_hash);
    EXPECT_NE(ids[0], ids[1]);
    ASSERT_TRUE(scheduler.wait_for_idle(5s));
}

// ════════════════════════════════════════════════════════
// Rate limiting
// ════════════════════════════════════════════════════════

TEST_F(UploadSchedulerTest, RateLimitPausesPipelineWithReason) {
    transport->script("doc-0.pdf", {transport_error(StatusCategory::RateLimited, "slow down", 10s)});
    UploadScheduler scheduler(make_config(1), transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(2));
    ASSERT_TRUE(eventually([&] { return scheduler.is_paused(); }));

    const auto pause = scheduler.pause_state();
    EXPECT_TRUE(pause.paused);
    EXPECT_NE(pause.reason.find("10"), std::string::npos) << pause.reason;
    EXPECT_GT(pause.remaining, 9s);

    const FileEntry limited = entry_of(scheduler, ids[0]);
    EXPECT_EQ(limited.status, FileStatus::Pending);
    EXPECT_EQ(limited.retry_count, 1u);
    EXPECT_FALSE(limited.error.has_value());

    // Nothing leaves Pending while paused
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(scheduler.counts().pending, 2u);
    EXPECT_EQ(transport->calls().size(), 1u);
}

TEST_F(UploadSchedulerTest, RateLimitedEntryRestartsAfterPauseElapses) {
    std::mutex times_mutex;
    std::chrono::steady_clock::time_point paused_at{};
    std::chrono::steady_clock::time_point resumed_at{};
    std::atomic<int> resumed_events{0};

    bus.subscribe<upo::events::PipelinePausedEvent>([&](const upo::events::PipelinePausedEvent&) {
        std::lock_guard lock(times_mutex);
        paused_at = std::chrono::steady_clock::now();
    });
    bus.subscribe<upo::events::PipelineResumedEvent>([&](const upo::events::PipelineResumedEvent&) {
        std::lock_guard lock(times_mutex);
        resumed_at = std::chrono::steady_clock::now();
        ++resumed_events;
    });

    transport->script("doc-0.pdf", {transport_error(StatusCategory::RateLimited, "slow down", 300ms)});
    UploadScheduler scheduler(make_config(2), transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(1));
    ASSERT_TRUE(eventually([&] { return scheduler.is_paused(); }));
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    EXPECT_FALSE(scheduler.is_paused());
    ASSERT_TRUE(eventually([&] { return resumed_events.load() == 1; }));
    {
        std::lock_guard lock(times_mutex);
        EXPECT_GE(resumed_at - paused_at, 290ms);
    }

    const FileEntry entry = entry_of(scheduler, ids[0]);
    EXPECT_EQ(entry.status, FileStatus::Success);
    EXPECT_EQ(entry.retry_count, 1u);
    EXPECT_EQ(transport->calls_for("doc-0.pdf"), 2u);
}

TEST_F(UploadSchedulerTest, RateLimitWithoutDelayUsesConfiguredDefault) {
    auto config = make_config(1);
    config.default_retry_after = 42s;
    transport->script("doc-0.pdf", {transport_error(StatusCategory::RateLimited, "slow down")});
    UploadScheduler scheduler(config, transport, nullptr, bus);

    scheduler.submit(make_batch(1));
    ASSERT_TRUE(eventually([&] { return scheduler.is_paused(); }));
    EXPECT_NE(scheduler.pause_state().reason.find("42"), std::string::npos);
}

TEST_F(UploadSchedulerTest, RateLimitCeilingMovesEntryToError) {
    auto config = make_config(1);
    config.max_rate_limit_retries = 2;
    transport->script("doc-0.pdf", {transport_error(StatusCategory::RateLimited, "slow", 20ms),
                                    transport_error(StatusCategory::RateLimited, "slow", 20ms),
                                    transport_error(StatusCategory::RateLimited, "slow", 20ms)});
    UploadScheduler scheduler(config, transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(1));
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    const FileEntry entry = entry_of(scheduler, ids[0]);
    EXPECT_EQ(entry.status, FileStatus::Error);
    EXPECT_EQ(entry.error.value_or(""), "Rate limited too many times (3 attempts)");
    EXPECT_EQ(transport->calls_for("doc-0.pdf"), 3u);
}

// ════════════════════════════════════════════════════════
// Compression
// ════════════════════════════════════════════════════════

TEST_F(UploadSchedulerTest, CompressionFailureUploadsOriginalBytes) {
    constexpr std::size_t kTwelveMb = 12 * 1024 * 1024;
    auto compression = std::make_shared<FakeCompression>(FakeCompression::Mode::Fail);
    std::atomic<int> fallbacks{0};
    bus.subscribe<upo::events::CompressionFallbackEvent>([&](const upo::events::CompressionFallbackEvent& e) {
        EXPECT_EQ(e.message, "codec unavailable");
        ++fallbacks;
    });

    UploadScheduler scheduler(make_config(), transport, compression, bus);
    auto ids = scheduler.submit({make_file("roof.jpg", kTwelveMb, "image/jpeg")});
    ASSERT_TRUE(scheduler.wait_for_idle(10s));

    EXPECT_EQ(compression->calls(), 1);
    EXPECT_EQ(fallbacks.load(), 1);
    EXPECT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Success);
    EXPECT_EQ(scheduler.counts().error, 0u);

    auto calls = transport->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].bytes, kTwelveMb);
    EXPECT_EQ(calls[0].mime_type, "image/jpeg");
}

TEST_F(UploadSchedulerTest, ThrowingCompressionFallsBackToOriginal) {
    auto compression = std::make_shared<FakeCompression>(FakeCompression::Mode::Throw);
    UploadScheduler scheduler(make_config(), transport, compression, bus);

    auto ids = scheduler.submit({make_file("wall.png", 2 * 1024 * 1024, "image/png")});
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    EXPECT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Success);
    EXPECT_EQ(transport->calls().at(0).bytes, 2u * 1024 * 1024);
}

TEST_F(UploadSchedulerTest, CompressionAppliesOnlyToLargeMatchingFiles) {
    auto compression = std::make_shared<FakeCompression>(FakeCompression::Mode::Halve);
    UploadScheduler scheduler(make_config(), transport, compression, bus);

    scheduler.submit({make_file("big.jpg", 2 * 1024 * 1024, "image/jpeg"),
                      make_file("small.jpg", 1024, "image/jpeg"),
                      make_file("big.pdf", 2 * 1024 * 1024, "application/pdf")});
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    EXPECT_EQ(compression->calls(), 1);
    for (const auto& call : transport->calls()) {
        if (call.name == "big.jpg") {
            EXPECT_EQ(call.bytes, 1024u * 1024);
        } else if (call.name == "small.jpg") {
            EXPECT_EQ(call.bytes, 1024u);
        } else {
            EXPECT_EQ(call.bytes, 2u * 1024 * 1024);
        }
    }
}

TEST_F(UploadSchedulerTest, CompressionDisabledSkipsAdapter) {
    auto config = make_config();
    config.compression_enabled = false;
    auto compression = std::make_shared<FakeCompression>(FakeCompression::Mode::Halve);
    UploadScheduler scheduler(config, transport, compression, bus);

    scheduler.submit({make_file("big.jpg", 2 * 1024 * 1024, "image/jpeg")});
    ASSERT_TRUE(scheduler.wait_for_idle(5s));
    EXPECT_EQ(compression->calls(), 0);
}

// ════════════════════════════════════════════════════════
// Remove / retry / clear / reset
// ════════════════════════════════════════════════════════

TEST_F(UploadSchedulerTest, RemovingUploadingEntryCancelsAndFreesSlot) {
    transport->set_gated(true);
    UploadScheduler scheduler(make_config(1), transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(2));
    ASSERT_TRUE(transport->wait_for_in_flight(1));
    ASSERT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Uploading);

    ASSERT_TRUE(scheduler.remove(ids[0]).is_ok());

    auto snapshot = scheduler.snapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].id, ids[1]);

    EXPECT_TRUE(eventually([&] { return transport->cancelled() == 1; }));
    EXPECT_TRUE(transport->wait_for_calls(2));
    EXPECT_TRUE(eventually([&] { return entry_of(scheduler, ids[1]).status == FileStatus::Uploading; }));
    EXPECT_EQ(scheduler.active_count(), 1u);

    transport->release(1);
    ASSERT_TRUE(scheduler.wait_for_idle(5s));
    EXPECT_EQ(entry_of(scheduler, ids[1]).status, FileStatus::Success);
    EXPECT_EQ(scheduler.snapshot().size(), 1u);
}

TEST_F(UploadSchedulerTest, RemovingWithUnconfirmedCancellationReleasesSlotImmediately) {
    transport->set_gated(true);
    transport->set_confirms_cancellation(false);
    UploadScheduler scheduler(make_config(1), transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(2));
    ASSERT_TRUE(transport->wait_for_in_flight(1));

    ASSERT_TRUE(scheduler.remove(ids[0]).is_ok());
    // The next entry claims the slot within the same call
    EXPECT_EQ(entry_of(scheduler, ids[1]).status, FileStatus::Uploading);
    EXPECT_EQ(scheduler.active_count(), 1u);

    transport->release(1);
    ASSERT_TRUE(scheduler.wait_for_idle(5s));
    EXPECT_EQ(entry_of(scheduler, ids[1]).status, FileStatus::Success);
}

TEST_F(UploadSchedulerTest, RemovingPendingEntryTouchesNothingElse) {
    transport->set_gated(true);
    UploadScheduler scheduler(make_config(1), transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(4));
    ASSERT_TRUE(transport->wait_for_in_flight(1));
    const auto before = scheduler.snapshot();

    ASSERT_TRUE(scheduler.remove(ids[2]).is_ok());
    const auto after = scheduler.snapshot();

    ASSERT_EQ(after.size(), before.size() - 1);
    for (const auto& entry : after) {
        auto it = std::find_if(before.begin(), before.end(), [&](const FileEntry& e) { return e.id == entry.id; });
        ASSERT_NE(it, before.end());
        EXPECT_EQ(it->status, entry.status);
    }

    transport->open_gate();
    ASSERT_TRUE(scheduler.wait_for_idle(5s));
}

TEST_F(UploadSchedulerTest, RemovingUnknownEntryFails) {
    UploadScheduler scheduler(make_config(), transport, nullptr, bus);
    auto result = scheduler.remove("file-999");
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("file-999"), std::string::npos);
}

TEST_F(UploadSchedulerTest, RetryRestartsOnlyTheFailedEntry) {
    transport->script("doc-1.pdf", {transport_error(StatusCategory::ClientError, "File type not allowed")});
    UploadScheduler scheduler(make_config(), transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(3));
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    FileEntry failed = entry_of(scheduler, ids[1]);
    ASSERT_EQ(failed.status, FileStatus::Error);
    EXPECT_EQ(failed.error.value_or(""), "File type not allowed");
    EXPECT_FALSE(failed.uploaded_url.has_value());

    const FileEntry first_before = entry_of(scheduler, ids[0]);
    const FileEntry third_before = entry_of(scheduler, ids[2]);

    ASSERT_TRUE(scheduler.retry(ids[1]).is_ok());
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    const FileEntry retried = entry_of(scheduler, ids[1]);
    EXPECT_EQ(retried.status, FileStatus::Success);
    EXPECT_FALSE(retried.error.has_value());
    EXPECT_EQ(transport->calls_for("doc-1.pdf"), 2u);
    EXPECT_EQ(transport->calls_for("doc-0.pdf"), 1u);
    EXPECT_EQ(transport->calls_for("doc-2.pdf"), 1u);
    EXPECT_EQ(scheduler.snapshot().size(), 3u);

    EXPECT_EQ(entry_of(scheduler, ids[0]).uploaded_url, first_before.uploaded_url);
    EXPECT_EQ(entry_of(scheduler, ids[2]).uploaded_url, third_before.uploaded_url);
}

TEST_F(UploadSchedulerTest, RetryRejectsEntriesNotInError) {
    UploadScheduler scheduler(make_config(), transport, nullptr, bus);
    auto ids = scheduler.submit(make_batch(1));
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    EXPECT_TRUE(scheduler.retry(ids[0]).is_error());
    EXPECT_TRUE(scheduler.retry("file-404").is_error());
    EXPECT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Success);
}

TEST_F(UploadSchedulerTest, CompletedFilesMatchSuccessEntries) {
    transport->script("doc-2.pdf", {transport_error(StatusCategory::ServerError, "boom")});
    UploadScheduler scheduler(make_config(), transport, nullptr, bus);

    scheduler.submit(make_batch(4));
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    auto completed = scheduler.completed_files();
    std::vector<std::string> completed_ids;
    for (const auto& file : completed) {
        completed_ids.push_back(file.id);
        EXPECT_FALSE(file.url.empty());
    }
    std::vector<std::string> success_ids;
    for (const auto& entry : scheduler.snapshot()) {
        if (entry.status == FileStatus::Success) {
            success_ids.push_back(entry.id);
        }
    }
    std::sort(completed_ids.begin(), completed_ids.end());
    std::sort(success_ids.begin(), success_ids.end());
    EXPECT_EQ(completed_ids, success_ids);
    EXPECT_EQ(completed.size(), 3u);

    EXPECT_EQ(scheduler.clear_completed(), 3u);
    auto counts = scheduler.counts();
    EXPECT_EQ(counts.success, 0u);
    EXPECT_EQ(counts.error, 1u);
    EXPECT_TRUE(scheduler.completed_files().empty());
}

TEST_F(UploadSchedulerTest, ResetDropsEverythingAndCancelsInFlight) {
    transport->set_gated(true);
    UploadScheduler scheduler(make_config(2), transport, nullptr, bus);

    scheduler.submit(make_batch(4));
    ASSERT_TRUE(transport->wait_for_in_flight(2));

    scheduler.reset();
    EXPECT_TRUE(scheduler.snapshot().empty());
    EXPECT_FALSE(scheduler.is_paused());
    EXPECT_TRUE(eventually([&] { return transport->cancelled() == 2; }));
    EXPECT_TRUE(scheduler.wait_for_idle(5s));
    EXPECT_FALSE(scheduler.is_uploading());

    transport->open_gate();
    auto ids = scheduler.submit(make_batch(1));
    ASSERT_TRUE(scheduler.wait_for_idle(5s));
    EXPECT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Success);
}

// ════════════════════════════════════════════════════════
// Network backoff and timeout
// ════════════════════════════════════════════════════════

TEST_F(UploadSchedulerTest, TransientNetworkFailureIsRetriedWithBackoff) {
    auto config = make_config(1);
    config.max_network_retries = 2;
    transport->script("doc-0.pdf", {transport_error(StatusCategory::Network, "connection reset"),
                                    transport_error(StatusCategory::Network, "connection reset")});
    UploadScheduler scheduler(config, transport, nullptr, bus);

    const auto start = std::chrono::steady_clock::now();
    auto ids = scheduler.submit(make_batch(1));
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    const FileEntry entry = entry_of(scheduler, ids[0]);
    EXPECT_EQ(entry.status, FileStatus::Success);
    EXPECT_EQ(entry.network_retries, 2u);
    EXPECT_EQ(transport->calls_for("doc-0.pdf"), 3u);
    // 20ms + 40ms of backoff
    EXPECT_GE(std::chrono::steady_clock::now() - start, 55ms);
}

TEST_F(UploadSchedulerTest, NetworkFailuresBeyondLimitBecomeError) {
    auto config = make_config(1);
    config.max_network_retries = 1;
    transport->script("doc-0.pdf", {transport_error(StatusCategory::Network, "connection reset"),
                                    transport_error(StatusCategory::Network, "host unreachable")});
    UploadScheduler scheduler(config, transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(1));
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    const FileEntry entry = entry_of(scheduler, ids[0]);
    EXPECT_EQ(entry.status, FileStatus::Error);
    EXPECT_EQ(entry.error.value_or(""), "host unreachable");
    EXPECT_EQ(entry.network_retries, 1u);
}

TEST_F(UploadSchedulerTest, BackedOffEntryDoesNotBlockOthers) {
    auto config = make_config(1);
    config.initial_backoff = 300ms;
    config.max_backoff = 300ms;
    transport->script("doc-0.pdf", {transport_error(StatusCategory::Network, "reset")});
    UploadScheduler scheduler(config, transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(2));
    ASSERT_TRUE(eventually([&] { return entry_of(scheduler, ids[1]).status == FileStatus::Success; }, 2s));
    EXPECT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Pending);

    ASSERT_TRUE(scheduler.wait_for_idle(5s));
    EXPECT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Success);
}

TEST_F(UploadSchedulerTest, UploadTimeoutFailsEntry) {
    auto config = make_config(1);
    config.upload_timeout = 1s;
    transport->set_gated(true);
    UploadScheduler scheduler(config, transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(1));
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    const FileEntry entry = entry_of(scheduler, ids[0]);
    EXPECT_EQ(entry.status, FileStatus::Error);
    EXPECT_EQ(entry.error.value_or(""), "Upload timed out after 1 seconds");
    EXPECT_EQ(transport->cancelled(), 1);
}

TEST_F(UploadSchedulerTest, UploadTimeoutWithUnconfirmedCancellationSettlesImmediately) {
    auto config = make_config(1);
    config.upload_timeout = 1s;
    transport->set_gated(true);
    transport->set_confirms_cancellation(false);
    UploadScheduler scheduler(config, transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(2));
    ASSERT_TRUE(eventually([&] { return entry_of(scheduler, ids[0]).status == FileStatus::Error; }, 3s));
    EXPECT_EQ(entry_of(scheduler, ids[0]).error.value_or(""), "Upload timed out after 1 seconds");

    // The freed slot goes to the next entry
    ASSERT_TRUE(eventually([&] { return transport->calls_for("doc-1.pdf") == 1; }, 2s));
    transport->open_gate();

    ASSERT_TRUE(scheduler.wait_for_idle(5s));
    EXPECT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Error);
    EXPECT_EQ(entry_of(scheduler, ids[1]).status, FileStatus::Success);
}

TEST_F(UploadSchedulerTest, UploadTimeoutDuringCompressionFailsWithoutTransfer) {
    auto config = make_config(1);
    config.upload_timeout = 1s;
    auto compression = std::make_shared<FakeCompression>(FakeCompression::Mode::Slow);
    UploadScheduler scheduler(config, transport, compression, bus);

    auto ids = scheduler.submit({make_file("large.jpg", 2 * 1024 * 1024, "image/jpeg")});
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    const FileEntry entry = entry_of(scheduler, ids[0]);
    EXPECT_EQ(entry.status, FileStatus::Error);
    EXPECT_EQ(entry.error.value_or(""), "Upload timed out after 1 seconds");
    EXPECT_EQ(compression->calls(), 1);
    EXPECT_TRUE(transport->calls().empty());
}

TEST_F(UploadSchedulerTest, UploadTimeoutFiresWhileStalledTransfersHoldEveryWorker) {
    auto config = make_config(1);
    config.upload_timeout = 1s;
    transport->set_confirms_cancellation(false);
    transport->stall("doc-0.pdf", 3s);
    transport->stall("doc-1.pdf", 3s);
    UploadScheduler scheduler(config, transport, nullptr, bus);

    const auto started = std::chrono::steady_clock::now();
    auto ids = scheduler.submit(make_batch(2));

    // doc-1 starts at doc-0's deadline and must fail at its own, while both
    // transfers are still asleep in the transport
    ASSERT_TRUE(eventually([&] { return entry_of(scheduler, ids[1]).status == FileStatus::Error; }, 5s));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2800ms);
    EXPECT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Error);
    EXPECT_EQ(entry_of(scheduler, ids[1]).error.value_or(""), "Upload timed out after 1 seconds");
    EXPECT_EQ(transport->calls().size(), 2u);
}

TEST_F(UploadSchedulerTest, RetryAfterUnconfirmedTimeoutWaitsForStalledTransfer) {
    auto config = make_config(4);
    config.upload_timeout = 1s;
    transport->set_confirms_cancellation(false);
    transport->stall("doc-0.pdf", 2s);
    UploadScheduler scheduler(config, transport, nullptr, bus);

    auto ids = scheduler.submit(make_batch(1));
    ASSERT_TRUE(eventually([&] { return entry_of(scheduler, ids[0]).status == FileStatus::Error; }, 3s));

    // The first transfer is still reading the source; the retry is parked
    ASSERT_TRUE(scheduler.retry(ids[0]).is_ok());
    EXPECT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Pending);
    EXPECT_EQ(transport->calls_for("doc-0.pdf"), 1u);

    ASSERT_TRUE(scheduler.wait_for_idle(5s));
    EXPECT_EQ(entry_of(scheduler, ids[0]).status, FileStatus::Success);
    EXPECT_EQ(transport->calls_for("doc-0.pdf"), 2u);
    EXPECT_EQ(transport->max_same_source_in_flight(), 1);
}

// ════════════════════════════════════════════════════════
// Thread safety
// ════════════════════════════════════════════════════════

TEST_F(UploadSchedulerTest, ConcurrentSubmitsKeepEveryEntryAndRespectCeiling) {
    const int num_threads = 8;
    const int files_per_thread = 25;
    const std::size_t expected = num_threads * files_per_thread;

    for (int t = 0; t < num_threads; ++t) {
        for (int i = 0; i < files_per_thread; ++i) {
            transport->stall("t" + std::to_string(t) + "-" + std::to_string(i) + ".pdf", 2ms);
        }
    }
    UploadScheduler scheduler(make_config(3), transport, nullptr, bus);

    std::mutex ids_mutex;
    std::vector<EntryId> all_ids;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < files_per_thread; ++i) {
                auto ids = scheduler.submit({make_file("t" + std::to_string(t) + "-" + std::to_string(i) + ".pdf",
                                                       256, "application/pdf", static_cast<std::uint8_t>(i))});
                std::lock_guard lock(ids_mutex);
                all_ids.insert(all_ids.end(), ids.begin(), ids.end());
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    ASSERT_TRUE(scheduler.wait_for_idle(20s));

    EXPECT_EQ(all_ids.size(), expected);
    EXPECT_EQ(std::set<EntryId>(all_ids.begin(), all_ids.end()).size(), expected);
    EXPECT_EQ(scheduler.snapshot().size(), expected);
    EXPECT_EQ(scheduler.counts().success, expected);
    EXPECT_EQ(transport->calls().size(), expected);
    EXPECT_LE(transport->max_in_flight(), 3);
    EXPECT_EQ(transport->max_same_source_in_flight(), 1);
}

// ════════════════════════════════════════════════════════
// Notifications
// ════════════════════════════════════════════════════════

TEST_F(UploadSchedulerTest, NotificationChannelReceivesPerEntryOutcomes) {
    upo::events::NotificationChannel channel(bus);
    transport->script("doc-1.pdf", {transport_error(StatusCategory::ClientError, "Too large")});
    UploadScheduler scheduler(make_config(), transport, nullptr, bus);

    scheduler.submit(make_batch(2));
    ASSERT_TRUE(scheduler.wait_for_idle(5s));

    // Events are delivered after the scheduler releases its lock, so drain with a timeout
    int successes = 0;
    int failures = 0;
    for (int i = 0; i < 2; ++i) {
        auto note = channel.queue().pop_for(2s);
        ASSERT_TRUE(note.has_value());
        if (note->kind == upo::events::Notification::Kind::Success) {
            ++successes;
            EXPECT_EQ(note->detail, "https://cdn.test/doc-0.pdf");
        } else {
            ++failures;
            EXPECT_EQ(note->name, "doc-1.pdf");
            EXPECT_EQ(note->detail, "Too large");
        }
    }
    EXPECT_EQ(successes, 1);
    EXPECT_EQ(failures, 1);
}
