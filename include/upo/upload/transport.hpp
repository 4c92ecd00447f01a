#pragma once

#include "upo/core/result.hpp"
#include "upo/upload/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace upo::upload {

enum class StatusCategory {
    RateLimited,
    ClientError,
    ServerError,
    Network,
    Cancelled,
    Timeout
};

const char* to_string(StatusCategory category) noexcept;

/**
 * @brief Structured failure reported by a transport
 *
 * `retry_after` is only meaningful for RateLimited. `http_status` is 0 when
 * no response was received.
 */
struct TransportError {
    StatusCategory category = StatusCategory::ServerError;
    int http_status = 0;
    std::string message;
    std::optional<std::chrono::milliseconds> retry_after;
};

/// Where the uploaded file gets attached on the server side
struct UploadMetadata {
    std::string entity_type;
    std::string entity_id;
    std::optional<std::string> category;
    std::optional<std::string> file_type;
};

struct UploadReceipt {
    std::string url;
    std::string key;
};

/**
 * @brief Cooperative cancellation flag shared between scheduler and adapter
 *
 * THREAD SAFETY: All methods are safe to call from any thread. cancel() is
 * idempotent; the first reason wins.
 */
class CancelToken {
public:
    enum class Reason {
        None,
        Removed,
        Reset,
        Timeout,
        Shutdown
    };

    void cancel(Reason reason) noexcept;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    [[nodiscard]] Reason reason() const noexcept {
        return reason_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<Reason> reason_{Reason::None};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;
using ProgressCallback = std::function<void(int percent)>;

/**
 * @brief Moves one file to the server
 *
 * Called from a scheduler worker thread, one call per pipeline unit. The
 * source is borrowed for the duration of the call. Implementations report
 * progress as 0-100, poll `cancel` and return StatusCategory::Cancelled once
 * it fires.
 */
class TransportAdapter {
public:
    virtual ~TransportAdapter() = default;

    virtual upo::Result<UploadReceipt, TransportError> upload(const SourceFile& source,
                                                              const UploadMetadata& metadata,
                                                              const ProgressCallback& on_progress,
                                                              const CancelToken& cancel) = 0;

    /**
     * @brief Whether upload() returns promptly after cancellation
     *
     * When false the scheduler frees the concurrency slot as soon as it
     * cancels a unit instead of waiting for the call to return.
     */
    virtual bool confirms_cancellation() const { return true; }
};

} // namespace upo::upload
