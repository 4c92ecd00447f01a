#pragma once

#include "upo/config/config.hpp"
#include "upo/core/result.hpp"
#include "upo/events/event_bus.hpp"
#include "upo/upload/compression.hpp"
#include "upo/upload/content_hasher.hpp"
#include "upo/upload/file_entry.hpp"
#include "upo/upload/rate_limit.hpp"
#include "upo/upload/transport.hpp"
#include "upo/upload/types.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace upo::upload {

/**
 * @brief Bounded-concurrency upload pipeline
 *
 * Owns the ordered entry list and every piece of mutable pipeline state.
 * Work is started by a single drain step that runs whenever capacity or
 * eligibility may have changed: on submit/retry, when a unit finishes, and
 * when a pause or backoff deadline elapses. Each started entry becomes a
 * pipeline unit (optional compression, then transport) posted to a worker
 * pool; the unit reports back through finish_unit().
 *
 * RATE LIMITING:
 * A rate-limited response pauses the whole pipeline. Running units finish,
 * nothing new starts, and the affected entry keeps its queue position.
 *
 * TIMEOUTS:
 * When the transport does not confirm cancellation, a timed-out entry is
 * settled at the deadline while the old call may still be reading the
 * source. A retry of that entry waits in Pending until the call returns.
 *
 * THREAD SAFETY:
 * All public methods are thread-safe. Events are emitted after the internal
 * lock is released, so handlers may call back into the scheduler.
 */
class UploadScheduler {
public:
    UploadScheduler(config::SchedulerConfig config,
                    std::shared_ptr<TransportAdapter> transport,
                    std::shared_ptr<CompressionAdapter> compression,
                    events::EventBus& bus);

    /// Cancels every running unit and waits for the worker pool to drain
    ~UploadScheduler();

    UploadScheduler(const UploadScheduler&) = delete;
    UploadScheduler& operator=(const UploadScheduler&) = delete;

    /**
     * @brief Queue files for upload
     *
     * Each file is hashed, appended as Pending, and the drain step runs.
     * Never waits for uploads.
     *
     * RETURNS: the new entry ids, in input order
     */
    std::vector<EntryId> submit(std::vector<SourceFile> files);

    /**
     * @brief Delete an entry in any state
     *
     * An in-flight entry vanishes from the snapshot immediately and its
     * cancel token fires. Its slot frees when the transport returns, or
     * right away if the transport does not confirm cancellation.
     */
    upo::Result<void> remove(const EntryId& id);

    /// Move an Error entry back to Pending; other entries are untouched.
    /// It restarts once no earlier transfer of the same source is running.
    upo::Result<void> retry(const EntryId& id);

    /// RETURNS: number of Success entries removed
    std::size_t clear_completed();

    /// Cancel everything, drop every entry and lift any pause
    void reset();

    [[nodiscard]] std::vector<FileEntry> snapshot() const;
    [[nodiscard]] std::optional<FileEntry> find(const EntryId& id) const;
    [[nodiscard]] UploadCounts counts() const;
    [[nodiscard]] PauseState pause_state() const;
    [[nodiscard]] bool is_paused() const;
    [[nodiscard]] bool is_uploading() const;
    [[nodiscard]] std::size_t active_count() const;
    [[nodiscard]] std::vector<CompletedFile> completed_files() const;

    /**
     * @brief Block until nothing is Pending, Compressing or Uploading
     *
     * RETURNS: false if `timeout` elapsed first
     */
    bool wait_for_idle(std::chrono::milliseconds timeout) const;

    [[nodiscard]] const config::SchedulerConfig& config() const noexcept { return config_; }

private:
    using Clock = std::chrono::steady_clock;
    using EventBatch = std::vector<std::function<void()>>;
    using UnitId = std::uint64_t;

    struct Record {
        UploadEntry entry;
        std::shared_ptr<const SourceFile> source;
        Clock::time_point not_before{};   ///< Network backoff; Pending entries wait until then
        std::optional<UnitId> unit;       ///< Set while a pipeline unit owns the entry
        std::optional<UnitId> orphan;     ///< Timed-out unit whose transport has not returned yet
    };

    struct ActiveUnit {
        EntryId entry_id;
        std::string name;
        CancelTokenPtr cancel;
        Clock::time_point started;
        bool holds_slot = true;
        bool timed_out = false;
        std::unique_ptr<boost::asio::steady_timer> timeout_timer;
    };

    struct UnitOutcome {
        upo::Result<UploadReceipt, TransportError> result;
        std::uint64_t bytes_sent = 0;
    };

    // Drain step. Caller holds mutex_.
    void drain_locked(EventBatch& batch);
    void start_unit_locked(Record& record, EventBatch& batch);
    void schedule_wake_locked(Clock::time_point deadline);
    void release_unit_locked(UnitId unit_id);
    void cancel_all_locked(CancelToken::Reason reason);
    [[nodiscard]] bool idle_locked() const;

    Record* find_record_locked(const EntryId& id);
    const Record* find_record_locked(const EntryId& id) const;
    Record* find_unit_record_locked(UnitId unit_id);

    // Pipeline unit, runs on a pool thread without the lock
    void run_unit(UnitId unit_id, EntryId entry_id, std::string name,
                  std::shared_ptr<const SourceFile> source, CancelTokenPtr cancel, bool compress);
    std::shared_ptr<const SourceFile> compress_or_fallback(const EntryId& entry_id,
                                                           const std::shared_ptr<const SourceFile>& source);
    upo::Result<UploadReceipt, TransportError> call_transport(UnitId unit_id,
                                                              const SourceFile& payload,
                                                              const CancelToken& cancel);
    void report_progress(UnitId unit_id, int percent);
    void finish_unit(UnitId unit_id, UnitOutcome outcome);
    void on_unit_timeout(UnitId unit_id);
    void on_wake();

    void apply_failure_locked(Record& record, const TransportError& error, bool timed_out, EventBatch& batch);
    void fail_locked(Record& record, std::string message, std::optional<StatusCategory> category, EventBatch& batch);
    std::string timeout_message() const;

    template<typename Event>
    void defer(EventBatch& batch, Event event) {
        batch.push_back([this, e = std::move(event)] { bus_.emit(e); });
    }

    static void flush(EventBatch& batch);

    const config::SchedulerConfig config_;
    const CompressionOptions compression_options_;
    std::shared_ptr<TransportAdapter> transport_;
    std::shared_ptr<CompressionAdapter> compression_;
    events::EventBus& bus_;
    ContentHasher hasher_;
    BackoffPolicy network_backoff_;

    // Declared before the timers so they outlive them. Timers get their own
    // thread: units may block every pool thread inside the transport.
    boost::asio::thread_pool pool_;
    boost::asio::thread_pool timer_pool_{1};

    mutable std::mutex mutex_;
    mutable std::condition_variable idle_cv_;
    std::vector<Record> entries_;
    std::unordered_map<UnitId, ActiveUnit> units_;
    std::size_t active_count_ = 0;
    RateLimitController pause_;
    std::optional<Clock::time_point> paused_since_;
    boost::asio::steady_timer wake_timer_;
    std::optional<Clock::time_point> wake_at_;
    std::uint64_t next_entry_ = 0;
    UnitId next_unit_ = 0;
    bool shutting_down_ = false;
};

} // namespace upo::upload
