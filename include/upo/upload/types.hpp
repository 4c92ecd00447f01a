#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace upo::upload {

using EntryId = std::string;

enum class FileStatus {
    Pending,
    Compressing,
    Uploading,
    Success,
    Error
};

const char* to_string(FileStatus status) noexcept;

/**
 * @brief Raw payload handed to the orchestrator by the caller
 *
 * The scheduler takes ownership on submit and only hands the bytes to one
 * pipeline unit at a time.
 */
struct SourceFile {
    std::string name;
    std::string mime_type;
    std::vector<std::uint8_t> bytes;

    [[nodiscard]] std::size_t size() const noexcept { return bytes.size(); }
};

/**
 * @brief Observable record of one file's upload lifecycle
 */
struct FileEntry {
    EntryId id;
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;

    FileStatus status = FileStatus::Pending;
    int progress = 0;                         ///< 0-100, meaningful while Uploading
    std::optional<std::string> content_hash;  ///< SHA-256 hex, set before enqueue

    std::optional<std::string> uploaded_url;  ///< Populated only in Success
    std::optional<std::string> uploaded_key;  ///< Populated only in Success
    std::optional<std::string> error;         ///< Populated only in Error

    std::uint32_t retry_count = 0;            ///< Rate-limit requeues
    std::uint32_t network_retries = 0;        ///< Transient network requeues

    [[nodiscard]] bool is_active() const noexcept {
        return status == FileStatus::Compressing || status == FileStatus::Uploading;
    }

    [[nodiscard]] bool is_terminal() const noexcept {
        return status == FileStatus::Success || status == FileStatus::Error;
    }
};

/**
 * @brief Caller-friendly view of a successfully uploaded file
 */
struct CompletedFile {
    EntryId id;
    std::string name;
    std::string url;
    std::string key;
    std::uint64_t size = 0;
    std::string mime_type;
};

struct UploadCounts {
    std::size_t pending = 0;
    std::size_t compressing = 0;
    std::size_t uploading = 0;
    std::size_t success = 0;
    std::size_t error = 0;

    [[nodiscard]] std::size_t active() const noexcept { return compressing + uploading; }
    [[nodiscard]] std::size_t total() const noexcept {
        return pending + compressing + uploading + success + error;
    }
};

struct PauseState {
    bool paused = false;
    std::string reason;
    std::chrono::milliseconds remaining{0};
};

} // namespace upo::upload
