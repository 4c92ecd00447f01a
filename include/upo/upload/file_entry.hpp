#pragma once

#include "upo/core/result.hpp"
#include "upo/upload/types.hpp"

#include <chrono>
#include <string>

namespace upo::upload {

/**
 * @brief Lifecycle owner for a single FileEntry
 *
 * Wraps the observable record and enforces the transition table:
 *
 *   Pending -> Compressing -> Uploading -> Success
 *   Pending -> Uploading
 *   Uploading -> Pending   (rate limited / transient network failure)
 *   Uploading -> Error
 *   Compressing -> Error   (per-upload timeout before the transfer began)
 *   Error -> Pending       (caller retry)
 *
 * Illegal moves are refused with an error and leave the record untouched.
 */
class UploadEntry {
public:
    UploadEntry(EntryId id, const SourceFile& source);

    [[nodiscard]] const EntryId& id() const noexcept { return info_.id; }
    [[nodiscard]] FileStatus status() const noexcept { return info_.status; }
    [[nodiscard]] const FileEntry& info() const noexcept { return info_; }

    void set_content_hash(std::string digest);

    upo::Result<void> begin_compression();
    upo::Result<void> begin_upload();

    /**
     * @brief Record upload progress
     *
     * Values are clamped to 0-100 and never move backwards; a lower value
     * than the current one is ignored rather than rejected.
     *
     * RETURNS: error if the entry is not Uploading
     */
    upo::Result<void> update_progress(int value);

    upo::Result<void> mark_success(std::string url, std::string key);
    upo::Result<void> mark_failed(std::string message);

    upo::Result<void> requeue_after_rate_limit();
    upo::Result<void> requeue_after_network_failure();

    upo::Result<void> reset_for_retry();

    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(FileStatus target) const noexcept;
    upo::Result<void> transition_to(FileStatus next);

    FileEntry info_;
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace upo::upload
