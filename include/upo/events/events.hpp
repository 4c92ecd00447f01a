/**
 * @file events.hpp
 * @brief Event types emitted by the upload scheduler
 *
 * NAMING CONVENTION:
 * Events are past-tense facts about one entry or about the pipeline.
 * Every per-entry event carries the entry id so observers can correlate.
 */

#pragma once

#include "upo/upload/transport.hpp"
#include "upo/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace upo::events {

// ════════════════════════════════════════════════════════
// Entry Events
// ════════════════════════════════════════════════════════

/**
 * @brief A file was accepted into the queue as Pending
 *
 * WHO SUBSCRIBES:
 * - Logger, Metrics
 */
struct EntrySubmittedEvent {
    upload::EntryId entry_id;
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;
    std::string content_hash;
};

/// An entry claimed a concurrency slot. `stage` is Compressing or Uploading.
struct EntryStartedEvent {
    upload::EntryId entry_id;
    std::string name;
    upload::FileStatus stage = upload::FileStatus::Uploading;
};

struct UploadProgressEvent {
    upload::EntryId entry_id;
    int progress = 0;
};

/**
 * @brief An entry reached Success
 *
 * WHO SUBSCRIBES:
 * - Logger, Metrics
 * - NotificationChannel (caller-facing success notice)
 */
struct UploadSucceededEvent {
    upload::EntryId entry_id;
    std::string name;
    std::string url;
    std::string key;
    std::uint64_t bytes_sent = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief An entry reached Error
 *
 * `category` is absent when the failure did not come from the transport
 * (for example the retry ceiling or the per-upload timeout).
 */
struct UploadFailedEvent {
    upload::EntryId entry_id;
    std::string name;
    std::string message;
    std::optional<upload::StatusCategory> category;
};

enum class RequeueReason {
    RateLimited,
    Network
};

/// An in-flight entry went back to Pending and will start again later
struct EntryRequeuedEvent {
    upload::EntryId entry_id;
    RequeueReason reason = RequeueReason::RateLimited;
    std::uint32_t attempt = 0;
    std::chrono::milliseconds delay{0};
};

struct EntryRemovedEvent {
    upload::EntryId entry_id;
    upload::FileStatus last_status = upload::FileStatus::Pending;
};

/// Compression failed; the original bytes are uploaded instead
struct CompressionFallbackEvent {
    upload::EntryId entry_id;
    std::string name;
    std::string message;
};

// ════════════════════════════════════════════════════════
// Pipeline Events
// ════════════════════════════════════════════════════════

struct PipelinePausedEvent {
    std::string reason;
    std::chrono::milliseconds delay{0};
};

struct PipelineResumedEvent {
    std::chrono::milliseconds paused_for{0};
};

} // namespace upo::events
