#include "upo/upload/scheduler.hpp"

#include "upo/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace upo::upload {

namespace asio = boost::asio;

namespace {

void check(const upo::Result<void>& result, const EntryId& id) {
    if (result.is_error()) {
        spdlog::error("[Scheduler] id={} {}", id, result.error());
    }
}

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

UploadScheduler::UploadScheduler(config::SchedulerConfig config,
                                 std::shared_ptr<TransportAdapter> transport,
                                 std::shared_ptr<CompressionAdapter> compression,
                                 events::EventBus& bus)
    : config_(std::move(config))
    , compression_options_(config_.compression_options())
    , transport_(std::move(transport))
    , compression_(std::move(compression))
    , bus_(bus)
    , network_backoff_(config_.max_network_retries, config_.initial_backoff, config_.max_backoff)
    , pool_(std::max<std::size_t>(config_.max_concurrent, 1) + 1)
    , wake_timer_(timer_pool_) {
    spdlog::debug("[Scheduler] created max_concurrent={} compression={} transport_confirms_cancel={}",
                  config_.max_concurrent,
                  compression_ && config_.compression_enabled ? compression_->name() : "off",
                  transport_->confirms_cancellation());
}

UploadScheduler::~UploadScheduler() {
    {
        std::lock_guard lock(mutex_);
        shutting_down_ = true;
        cancel_all_locked(CancelToken::Reason::Shutdown);
        wake_timer_.cancel();
    }
    pool_.join();
    timer_pool_.join();
}

// ════════════════════════════════════════════════════════
// Caller operations
// ════════════════════════════════════════════════════════

std::vector<EntryId> UploadScheduler::submit(std::vector<SourceFile> files) {
    // Hash outside the lock; digests only depend on the bytes
    std::vector<std::optional<std::string>> digests;
    digests.reserve(files.size());
    for (const auto& file : files) {
        try {
            digests.emplace_back(hasher_.hash(file));
        } catch (const std::exception& e) {
            spdlog::warn("[Scheduler] hashing failed for {}: {}", file.name, e.what());
            digests.emplace_back(std::nullopt);
        }
    }

    std::vector<EntryId> ids;
    ids.reserve(files.size());
    EventBatch batch;
    {
        std::lock_guard lock(mutex_);
        for (std::size_t i = 0; i < files.size(); ++i) {
            EntryId id = "file-" + std::to_string(++next_entry_);
            auto source = std::make_shared<const SourceFile>(std::move(files[i]));

            UploadEntry entry(id, *source);
            if (digests[i]) {
                entry.set_content_hash(*digests[i]);
            }

            events::EntrySubmittedEvent submitted{id, source->name, source->size(), source->mime_type,
                                                  digests[i].value_or("")};
            entries_.push_back(Record{std::move(entry), std::move(source), Clock::time_point{}, std::nullopt, std::nullopt});
            defer(batch, std::move(submitted));
            ids.push_back(std::move(id));
        }
        drain_locked(batch);
    }
    flush(batch);
    return ids;
}

upo::Result<void> UploadScheduler::remove(const EntryId& id) {
    EventBatch batch;
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&id](const Record& r) { return r.entry.id() == id; });
        if (it == entries_.end()) {
            return upo::Err<void>("Unknown entry: " + id);
        }

        const FileStatus last_status = it->entry.status();
        if (it->unit) {
            auto unit_it = units_.find(*it->unit);
            if (unit_it != units_.end()) {
                unit_it->second.cancel->cancel(CancelToken::Reason::Removed);
                if (unit_it->second.timeout_timer) {
                    unit_it->second.timeout_timer->cancel();
                }
                if (!transport_->confirms_cancellation()) {
                    release_unit_locked(*it->unit);
                }
            }
        }

        entries_.erase(it);
        defer(batch, events::EntryRemovedEvent{id, last_status});
        drain_locked(batch);
    }
    flush(batch);
    return upo::Ok();
}

upo::Result<void> UploadScheduler::retry(const EntryId& id) {
    EventBatch batch;
    {
        std::lock_guard lock(mutex_);
        Record* record = find_record_locked(id);
        if (!record) {
            return upo::Err<void>("Unknown entry: " + id);
        }
        auto result = record->entry.reset_for_retry();
        if (result.is_error()) {
            return result;
        }
        record->not_before = Clock::time_point{};
        spdlog::debug("[Scheduler] retry id={} waiting_for_unit={}", id, record->orphan.has_value());
        drain_locked(batch);
    }
    flush(batch);
    return upo::Ok();
}

std::size_t UploadScheduler::clear_completed() {
    EventBatch batch;
    std::size_t removed = 0;
    {
        std::lock_guard lock(mutex_);
        auto it = std::remove_if(entries_.begin(), entries_.end(), [&](const Record& r) {
            if (r.entry.status() != FileStatus::Success) {
                return false;
            }
            defer(batch, events::EntryRemovedEvent{r.entry.id(), FileStatus::Success});
            ++removed;
            return true;
        });
        entries_.erase(it, entries_.end());
        idle_cv_.notify_all();
    }
    flush(batch);
    return removed;
}

void UploadScheduler::reset() {
    EventBatch batch;
    {
        std::lock_guard lock(mutex_);
        cancel_all_locked(CancelToken::Reason::Reset);
        for (const auto& record : entries_) {
            defer(batch, events::EntryRemovedEvent{record.entry.id(), record.entry.status()});
        }
        entries_.clear();
        pause_.clear();
        paused_since_.reset();
        wake_at_.reset();
        wake_timer_.cancel();
        idle_cv_.notify_all();
        spdlog::debug("[Scheduler] reset");
    }
    flush(batch);
}

// ════════════════════════════════════════════════════════
// Observers
// ════════════════════════════════════════════════════════

std::vector<FileEntry> UploadScheduler::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<FileEntry> out;
    out.reserve(entries_.size());
    for (const auto& record : entries_) {
        out.push_back(record.entry.info());
    }
    return out;
}

std::optional<FileEntry> UploadScheduler::find(const EntryId& id) const {
    std::lock_guard lock(mutex_);
    const Record* record = find_record_locked(id);
    if (!record) {
        return std::nullopt;
    }
    return record->entry.info();
}

UploadCounts UploadScheduler::counts() const {
    std::lock_guard lock(mutex_);
    UploadCounts counts;
    for (const auto& record : entries_) {
        switch (record.entry.status()) {
            case FileStatus::Pending: ++counts.pending; break;
            case FileStatus::Compressing: ++counts.compressing; break;
            case FileStatus::Uploading: ++counts.uploading; break;
            case FileStatus::Success: ++counts.success; break;
            case FileStatus::Error: ++counts.error; break;
        }
    }
    return counts;
}

PauseState UploadScheduler::pause_state() const {
    std::lock_guard lock(mutex_);
    return pause_.state();
}

bool UploadScheduler::is_paused() const {
    std::lock_guard lock(mutex_);
    return pause_.is_paused();
}

bool UploadScheduler::is_uploading() const {
    std::lock_guard lock(mutex_);
    return active_count_ > 0;
}

std::size_t UploadScheduler::active_count() const {
    std::lock_guard lock(mutex_);
    return active_count_;
}

std::vector<CompletedFile> UploadScheduler::completed_files() const {
    std::lock_guard lock(mutex_);
    std::vector<CompletedFile> out;
    for (const auto& record : entries_) {
        const FileEntry& info = record.entry.info();
        if (info.status != FileStatus::Success) {
            continue;
        }
        out.push_back(CompletedFile{info.id, info.name, info.uploaded_url.value_or(""),
                                    info.uploaded_key.value_or(""), info.size, info.mime_type});
    }
    return out;
}

bool UploadScheduler::wait_for_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return idle_locked(); });
}

// ════════════════════════════════════════════════════════
// Drain step
// ════════════════════════════════════════════════════════

void UploadScheduler::drain_locked(EventBatch& batch) {
    idle_cv_.notify_all();
    if (shutting_down_) {
        return;
    }

    if (pause_.is_paused()) {
        if (auto deadline = pause_.deadline()) {
            schedule_wake_locked(*deadline);
        }
        return;
    }
    if (paused_since_) {
        defer(batch, events::PipelineResumedEvent{elapsed_since(*paused_since_)});
        paused_since_.reset();
    }

    const auto now = Clock::now();
    std::optional<Clock::time_point> next_eligible;

    for (auto& record : entries_) {
        if (active_count_ >= config_.max_concurrent) {
            break;
        }
        if (record.entry.status() != FileStatus::Pending || record.orphan) {
            continue;
        }
        if (record.not_before > now) {
            if (!next_eligible || record.not_before < *next_eligible) {
                next_eligible = record.not_before;
            }
            continue;
        }
        start_unit_locked(record, batch);
    }

    if (next_eligible && active_count_ < config_.max_concurrent) {
        schedule_wake_locked(*next_eligible);
    }
}

void UploadScheduler::start_unit_locked(Record& record, EventBatch& batch) {
    const bool compress = compression_ && config_.compression_enabled &&
                          should_compress(*record.source, compression_options_);

    auto moved = compress ? record.entry.begin_compression() : record.entry.begin_upload();
    if (moved.is_error()) {
        check(moved, record.entry.id());
        return;
    }

    const UnitId unit_id = ++next_unit_;
    ActiveUnit unit;
    unit.entry_id = record.entry.id();
    unit.name = record.entry.info().name;
    unit.cancel = std::make_shared<CancelToken>();
    unit.started = Clock::now();

    if (config_.upload_timeout.count() > 0) {
        unit.timeout_timer = std::make_unique<asio::steady_timer>(timer_pool_, config_.upload_timeout);
        unit.timeout_timer->async_wait([this, unit_id](const boost::system::error_code& ec) {
            if (!ec) {
                on_unit_timeout(unit_id);
            }
        });
    }

    CancelTokenPtr cancel = unit.cancel;
    record.unit = unit_id;
    units_.emplace(unit_id, std::move(unit));
    ++active_count_;

    defer(batch, events::EntryStartedEvent{record.entry.id(), record.entry.info().name, record.entry.status()});
    spdlog::debug("[Scheduler] start id={} unit={} active={}/{}",
                  record.entry.id(), unit_id, active_count_, config_.max_concurrent);

    asio::post(pool_, [this, unit_id, id = record.entry.id(), name = record.entry.info().name,
                       source = record.source, cancel, compress]() mutable {
        run_unit(unit_id, std::move(id), std::move(name), std::move(source), std::move(cancel), compress);
    });
}

void UploadScheduler::schedule_wake_locked(Clock::time_point deadline) {
    if (wake_at_ && *wake_at_ <= deadline) {
        return;
    }
    wake_at_ = deadline;
    wake_timer_.expires_at(deadline);
    wake_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec != asio::error::operation_aborted) {
            on_wake();
        }
    });
}

void UploadScheduler::on_wake() {
    EventBatch batch;
    {
        std::lock_guard lock(mutex_);
        wake_at_.reset();
        drain_locked(batch);
    }
    flush(batch);
}

void UploadScheduler::release_unit_locked(UnitId unit_id) {
    auto it = units_.find(unit_id);
    if (it == units_.end() || !it->second.holds_slot) {
        return;
    }
    it->second.holds_slot = false;
    --active_count_;
}

void UploadScheduler::cancel_all_locked(CancelToken::Reason reason) {
    const bool release = !transport_->confirms_cancellation();
    for (auto& [unit_id, unit] : units_) {
        unit.cancel->cancel(reason);
        if (unit.timeout_timer) {
            unit.timeout_timer->cancel();
        }
        if (release && unit.holds_slot) {
            unit.holds_slot = false;
            --active_count_;
        }
    }
    for (auto& record : entries_) {
        record.unit.reset();
    }
}

bool UploadScheduler::idle_locked() const {
    if (active_count_ > 0) {
        return false;
    }
    return std::none_of(entries_.begin(), entries_.end(), [](const Record& r) {
        return r.entry.status() == FileStatus::Pending || r.entry.info().is_active();
    });
}

UploadScheduler::Record* UploadScheduler::find_record_locked(const EntryId& id) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&id](const Record& r) { return r.entry.id() == id; });
    return it == entries_.end() ? nullptr : &*it;
}

const UploadScheduler::Record* UploadScheduler::find_record_locked(const EntryId& id) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&id](const Record& r) { return r.entry.id() == id; });
    return it == entries_.end() ? nullptr : &*it;
}

UploadScheduler::Record* UploadScheduler::find_unit_record_locked(UnitId unit_id) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [unit_id](const Record& r) { return r.unit && *r.unit == unit_id; });
    return it == entries_.end() ? nullptr : &*it;
}

// ════════════════════════════════════════════════════════
// Pipeline unit
// ════════════════════════════════════════════════════════

void UploadScheduler::run_unit(UnitId unit_id, EntryId entry_id, std::string name,
                               std::shared_ptr<const SourceFile> source, CancelTokenPtr cancel, bool compress) {
    std::shared_ptr<const SourceFile> payload = source;

    if (compress) {
        payload = compress_or_fallback(entry_id, source);

        std::lock_guard lock(mutex_);
        Record* record = find_unit_record_locked(unit_id);
        if (record && !cancel->is_cancelled()) {
            check(record->entry.begin_upload(), entry_id);
        }
    }

    spdlog::debug("[Scheduler] upload id={} name={} bytes={}", entry_id, name, payload->size());

    auto result = cancel->is_cancelled()
        ? upo::Err<UploadReceipt, TransportError>(TransportError{StatusCategory::Cancelled, 0, "Cancelled", std::nullopt})
        : call_transport(unit_id, *payload, *cancel);

    finish_unit(unit_id, UnitOutcome{std::move(result), payload->size()});
}

std::shared_ptr<const SourceFile> UploadScheduler::compress_or_fallback(const EntryId& entry_id,
                                                                        const std::shared_ptr<const SourceFile>& source) {
    std::string failure;
    try {
        auto compressed = compression_->compress(*source, compression_options_);
        if (compressed.is_ok()) {
            spdlog::debug("[Scheduler] compressed id={} {} -> {} bytes",
                          entry_id, source->size(), compressed.value().size());
            return std::make_shared<const SourceFile>(std::move(compressed.value()));
        }
        failure = compressed.error().message;
    } catch (const std::exception& e) {
        failure = e.what();
    }

    bus_.emit(events::CompressionFallbackEvent{entry_id, source->name, failure});
    return source;
}

upo::Result<UploadReceipt, TransportError> UploadScheduler::call_transport(UnitId unit_id,
                                                                           const SourceFile& payload,
                                                                           const CancelToken& cancel) {
    ProgressCallback on_progress = [this, unit_id](int percent) { report_progress(unit_id, percent); };
    try {
        return transport_->upload(payload, config_.upload, on_progress, cancel);
    } catch (const std::exception& e) {
        return upo::Err<UploadReceipt, TransportError>(
            TransportError{StatusCategory::ServerError, 0, e.what(), std::nullopt});
    }
}

void UploadScheduler::report_progress(UnitId unit_id, int percent) {
    std::optional<events::UploadProgressEvent> event;
    {
        std::lock_guard lock(mutex_);
        Record* record = find_unit_record_locked(unit_id);
        if (!record || record->entry.status() != FileStatus::Uploading) {
            return;
        }
        const int before = record->entry.info().progress;
        check(record->entry.update_progress(percent), record->entry.id());
        const int after = record->entry.info().progress;
        if (after != before) {
            event = events::UploadProgressEvent{record->entry.id(), after};
        }
    }
    if (event) {
        bus_.emit(*event);
    }
}

void UploadScheduler::on_unit_timeout(UnitId unit_id) {
    EventBatch batch;
    {
        std::lock_guard lock(mutex_);
        auto it = units_.find(unit_id);
        if (it == units_.end()) {
            return;
        }
        it->second.timed_out = true;
        it->second.cancel->cancel(CancelToken::Reason::Timeout);
        spdlog::debug("[Scheduler] unit={} id={} timed out", unit_id, it->second.entry_id);

        // The transport may never return; settle the entry now
        if (!transport_->confirms_cancellation()) {
            if (Record* record = find_unit_record_locked(unit_id)) {
                record->unit.reset();
                record->orphan = unit_id;
                fail_locked(*record, timeout_message(), StatusCategory::Timeout, batch);
            }
            release_unit_locked(unit_id);
            drain_locked(batch);
        }
    }
    flush(batch);
}

void UploadScheduler::finish_unit(UnitId unit_id, UnitOutcome outcome) {
    EventBatch batch;
    {
        std::lock_guard lock(mutex_);
        auto unit_it = units_.find(unit_id);
        if (unit_it == units_.end()) {
            return;
        }
        if (unit_it->second.holds_slot) {
            --active_count_;
        }
        const bool timed_out = unit_it->second.timed_out;
        const auto started = unit_it->second.started;
        units_.erase(unit_it);

        // A retry parked behind this call may start now
        auto orphaned = std::find_if(entries_.begin(), entries_.end(),
                                     [unit_id](const Record& r) { return r.orphan && *r.orphan == unit_id; });
        if (orphaned != entries_.end()) {
            orphaned->orphan.reset();
        }

        Record* record = find_unit_record_locked(unit_id);
        if (record && !shutting_down_) {
            record->unit.reset();
            if (outcome.result.is_ok()) {
                UploadReceipt& receipt = outcome.result.value();
                check(record->entry.mark_success(receipt.url, receipt.key), record->entry.id());
                defer(batch, events::UploadSucceededEvent{record->entry.id(), record->entry.info().name,
                                                          receipt.url, receipt.key, outcome.bytes_sent,
                                                          elapsed_since(started)});
            } else {
                apply_failure_locked(*record, outcome.result.error(), timed_out, batch);
            }
        }

        drain_locked(batch);
    }
    flush(batch);
}

void UploadScheduler::apply_failure_locked(Record& record, const TransportError& error, bool timed_out,
                                           EventBatch& batch) {
    const EntryId& id = record.entry.id();

    // Whatever the transport reported after the deadline fired is a timeout
    if (timed_out) {
        fail_locked(record, timeout_message(), StatusCategory::Timeout, batch);
        return;
    }

    switch (error.category) {
        case StatusCategory::RateLimited: {
            const auto delay = error.retry_after.value_or(
                std::chrono::duration_cast<std::chrono::milliseconds>(config_.default_retry_after));
            const auto deadline = pause_.arm(delay);
            if (!paused_since_) {
                paused_since_ = Clock::now();
            }
            defer(batch, events::PipelinePausedEvent{pause_.reason(), delay});
            schedule_wake_locked(deadline);

            const std::uint32_t attempts = record.entry.info().retry_count + 1;
            if (attempts > config_.max_rate_limit_retries) {
                fail_locked(record, "Rate limited too many times (" + std::to_string(attempts) + " attempts)",
                            StatusCategory::RateLimited, batch);
                return;
            }
            check(record.entry.requeue_after_rate_limit(), id);
            defer(batch, events::EntryRequeuedEvent{id, events::RequeueReason::RateLimited,
                                                    record.entry.info().retry_count, delay});
            return;
        }

        case StatusCategory::Network: {
            const std::uint32_t spent = record.entry.info().network_retries;
            if (!network_backoff_.should_retry(spent)) {
                fail_locked(record, error.message, StatusCategory::Network, batch);
                return;
            }
            const auto delay = network_backoff_.delay_before_retry(spent);
            check(record.entry.requeue_after_network_failure(), id);
            record.not_before = Clock::now() + delay;
            defer(batch, events::EntryRequeuedEvent{id, events::RequeueReason::Network,
                                                    record.entry.info().network_retries, delay});
            return;
        }

        case StatusCategory::Cancelled:
        case StatusCategory::ClientError:
        case StatusCategory::ServerError:
        case StatusCategory::Timeout:
            fail_locked(record, error.message, error.category, batch);
            return;
    }
}

void UploadScheduler::fail_locked(Record& record, std::string message, std::optional<StatusCategory> category,
                                  EventBatch& batch) {
    defer(batch, events::UploadFailedEvent{record.entry.id(), record.entry.info().name, message, category});
    check(record.entry.mark_failed(std::move(message)), record.entry.id());
}

std::string UploadScheduler::timeout_message() const {
    return "Upload timed out after " + std::to_string(config_.upload_timeout.count()) + " seconds";
}

void UploadScheduler::flush(EventBatch& batch) {
    for (auto& emit : batch) {
        emit();
    }
    batch.clear();
}

} // namespace upo::upload
