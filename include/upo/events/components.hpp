/**
 * @file components.hpp
 * @brief Observers that react to scheduler events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * NotificationChannel notifications(bus);
 * UploadScheduler scheduler(config, transport, compression, bus);
 */

#pragma once

#include "upo/events/event_bus.hpp"
#include "upo/events/event_queue.hpp"
#include "upo/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace upo::events {

/**
 * @brief Unsubscribes everything it registered when it goes out of scope
 *
 * Components capture `this` in their handlers, so they must detach from the
 * bus before they are destroyed.
 */
class ScopedSubscriptions {
public:
    explicit ScopedSubscriptions(EventBus& bus) : bus_(bus) {}

    ScopedSubscriptions(const ScopedSubscriptions&) = delete;
    ScopedSubscriptions& operator=(const ScopedSubscriptions&) = delete;

    ~ScopedSubscriptions() {
        for (auto& detach : detachers_) {
            detach();
        }
    }

    template<typename EventType>
    void add(std::function<void(const EventType&)> handler) {
        const size_t id = bus_.subscribe<EventType>(std::move(handler));
        detachers_.push_back([this, id] { bus_.unsubscribe<EventType>(id); });
    }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> detachers_;
};

/**
 * @brief Logs every upload event with spdlog
 *
 * Lifecycle at info, progress at debug, requeue/pause/fallback at warn,
 * terminal failures at error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : subs_(bus) {
        subs_.add<EntrySubmittedEvent>([](const EntrySubmittedEvent& e) {
            spdlog::info("[Submitted] id={} name={} size={} mime={} hash={}",
                         e.entry_id, e.name, e.size, e.mime_type, e.content_hash);
        });

        subs_.add<EntryStartedEvent>([](const EntryStartedEvent& e) {
            spdlog::info("[Started] id={} name={} stage={}", e.entry_id, e.name, upload::to_string(e.stage));
        });

        subs_.add<UploadProgressEvent>([](const UploadProgressEvent& e) {
            spdlog::debug("[Progress] id={} progress={}%", e.entry_id, e.progress);
        });

        subs_.add<UploadSucceededEvent>([](const UploadSucceededEvent& e) {
            spdlog::info("[Uploaded] id={} name={} url={} key={} bytes={} duration={}ms",
                         e.entry_id, e.name, e.url, e.key, e.bytes_sent, e.duration.count());
        });

        subs_.add<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::error("[Failed] id={} name={} category={} message={}",
                          e.entry_id, e.name,
                          e.category ? upload::to_string(*e.category) : "scheduler",
                          e.message);
        });

        subs_.add<EntryRequeuedEvent>([](const EntryRequeuedEvent& e) {
            spdlog::warn("[Requeued] id={} reason={} attempt={} delay={}ms",
                         e.entry_id,
                         e.reason == RequeueReason::RateLimited ? "rate_limited" : "network",
                         e.attempt, e.delay.count());
        });

        subs_.add<EntryRemovedEvent>([](const EntryRemovedEvent& e) {
            spdlog::info("[Removed] id={} last_status={}", e.entry_id, upload::to_string(e.last_status));
        });

        subs_.add<CompressionFallbackEvent>([](const CompressionFallbackEvent& e) {
            spdlog::warn("[CompressionFallback] id={} name={} message={}", e.entry_id, e.name, e.message);
        });

        subs_.add<PipelinePausedEvent>([](const PipelinePausedEvent& e) {
            spdlog::warn("[Paused] delay={}ms reason={}", e.delay.count(), e.reason);
        });

        subs_.add<PipelineResumedEvent>([](const PipelineResumedEvent& e) {
            spdlog::info("[Resumed] paused_for={}ms", e.paused_for.count());
        });
    }

private:
    ScopedSubscriptions subs_;
};

/**
 * @brief Counts pipeline outcomes for a run summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_submitted{0};
        std::atomic<uint64_t> bytes_submitted{0};
        std::atomic<uint64_t> files_uploaded{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> files_failed{0};
        std::atomic<uint64_t> rate_limit_requeues{0};
        std::atomic<uint64_t> network_requeues{0};
        std::atomic<uint64_t> compression_fallbacks{0};
        std::atomic<uint64_t> files_removed{0};
        std::atomic<uint64_t> pauses{0};
    };

    explicit MetricsComponent(EventBus& bus) : subs_(bus) {
        subs_.add<EntrySubmittedEvent>([this](const EntrySubmittedEvent& e) {
            stats_.files_submitted++;
            stats_.bytes_submitted += e.size;
        });

        subs_.add<UploadSucceededEvent>([this](const UploadSucceededEvent& e) {
            stats_.files_uploaded++;
            stats_.bytes_uploaded += e.bytes_sent;
        });

        subs_.add<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.files_failed++;
        });

        subs_.add<EntryRequeuedEvent>([this](const EntryRequeuedEvent& e) {
            if (e.reason == RequeueReason::RateLimited) {
                stats_.rate_limit_requeues++;
            } else {
                stats_.network_requeues++;
            }
        });

        subs_.add<CompressionFallbackEvent>([this](const CompressionFallbackEvent&) {
            stats_.compression_fallbacks++;
        });

        subs_.add<EntryRemovedEvent>([this](const EntryRemovedEvent&) {
            stats_.files_removed++;
        });

        subs_.add<PipelinePausedEvent>([this](const PipelinePausedEvent&) {
            stats_.pauses++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Files submitted:       {}", stats_.files_submitted.load());
        spdlog::info("  Bytes submitted:       {}", stats_.bytes_submitted.load());
        spdlog::info("  Files uploaded:        {}", stats_.files_uploaded.load());
        spdlog::info("  Bytes uploaded:        {}", stats_.bytes_uploaded.load());
        spdlog::info("  Files failed:          {}", stats_.files_failed.load());
        spdlog::info("  Rate-limit requeues:   {}", stats_.rate_limit_requeues.load());
        spdlog::info("  Network requeues:      {}", stats_.network_requeues.load());
        spdlog::info("  Compression fallbacks: {}", stats_.compression_fallbacks.load());
        spdlog::info("  Files removed:         {}", stats_.files_removed.load());
        spdlog::info("  Pauses:                {}", stats_.pauses.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
    ScopedSubscriptions subs_;
};

struct Notification {
    enum class Kind {
        Success,
        Failure
    };

    Kind kind = Kind::Success;
    upload::EntryId entry_id;
    std::string name;
    std::string detail;  ///< URL on success, error message on failure
};

/**
 * @brief Per-entry outcome notices the caller drains at its own pace
 *
 * USAGE:
 * NotificationChannel channel(bus);
 * while (auto note = channel.queue().pop_for(std::chrono::seconds(1))) { ... }
 */
class NotificationChannel {
public:
    explicit NotificationChannel(EventBus& bus) : subs_(bus) {
        subs_.add<UploadSucceededEvent>([this](const UploadSucceededEvent& e) {
            queue_.push(Notification{Notification::Kind::Success, e.entry_id, e.name, e.url});
        });

        subs_.add<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            queue_.push(Notification{Notification::Kind::Failure, e.entry_id, e.name, e.message});
        });
    }

    ~NotificationChannel() {
        queue_.shutdown();
    }

    ThreadSafeQueue<Notification>& queue() { return queue_; }

private:
    ThreadSafeQueue<Notification> queue_;
    ScopedSubscriptions subs_;
};

} // namespace upo::events
