#include "upo/upload/file_entry.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace upo::upload {
namespace {

bool is_allowed(FileStatus current, FileStatus target) {
    static const std::unordered_map<FileStatus, std::vector<FileStatus>> transitions {
        {FileStatus::Pending, {FileStatus::Compressing, FileStatus::Uploading}},
        {FileStatus::Compressing, {FileStatus::Uploading, FileStatus::Error}},
        {FileStatus::Uploading, {FileStatus::Success, FileStatus::Pending, FileStatus::Error}},
        {FileStatus::Error, {FileStatus::Pending}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

std::string illegal(FileStatus from, FileStatus to) {
    return std::string("Illegal entry transition ") + to_string(from) + " -> " + to_string(to);
}

} // namespace

const char* to_string(FileStatus status) noexcept {
    switch (status) {
        case FileStatus::Pending: return "pending";
        case FileStatus::Compressing: return "compressing";
        case FileStatus::Uploading: return "uploading";
        case FileStatus::Success: return "success";
        case FileStatus::Error: return "error";
    }
    return "unknown";
}

UploadEntry::UploadEntry(EntryId id, const SourceFile& source) {
    info_.id = std::move(id);
    info_.name = source.name;
    info_.size = source.size();
    info_.mime_type = source.mime_type;
    info_.status = FileStatus::Pending;
    last_transition_ = std::chrono::steady_clock::now();
}

void UploadEntry::set_content_hash(std::string digest) {
    info_.content_hash = std::move(digest);
}

upo::Result<void> UploadEntry::begin_compression() {
    return transition_to(FileStatus::Compressing);
}

upo::Result<void> UploadEntry::begin_upload() {
    auto result = transition_to(FileStatus::Uploading);
    if (result.is_ok()) {
        info_.progress = 0;
    }
    return result;
}

upo::Result<void> UploadEntry::update_progress(int value) {
    if (info_.status != FileStatus::Uploading) {
        return upo::Err<void>(std::string("Progress reported for entry that is not uploading: ") + info_.id);
    }
    const int clamped = std::clamp(value, 0, 100);
    if (clamped > info_.progress) {
        info_.progress = clamped;
    }
    return upo::Ok();
}

upo::Result<void> UploadEntry::mark_success(std::string url, std::string key) {
    if (auto result = transition_to(FileStatus::Success); result.is_error()) {
        return result;
    }
    info_.progress = 100;
    info_.uploaded_url = std::move(url);
    info_.uploaded_key = std::move(key);
    info_.error.reset();
    return upo::Ok();
}

upo::Result<void> UploadEntry::mark_failed(std::string message) {
    if (auto result = transition_to(FileStatus::Error); result.is_error()) {
        return result;
    }
    info_.progress = 0;
    info_.error = std::move(message);
    info_.uploaded_url.reset();
    info_.uploaded_key.reset();
    return upo::Ok();
}

upo::Result<void> UploadEntry::requeue_after_rate_limit() {
    if (info_.status != FileStatus::Uploading) {
        return upo::Err<void>(illegal(info_.status, FileStatus::Pending));
    }
    if (auto result = transition_to(FileStatus::Pending); result.is_error()) {
        return result;
    }
    info_.progress = 0;
    ++info_.retry_count;
    return upo::Ok();
}

upo::Result<void> UploadEntry::requeue_after_network_failure() {
    if (info_.status != FileStatus::Uploading) {
        return upo::Err<void>(illegal(info_.status, FileStatus::Pending));
    }
    if (auto result = transition_to(FileStatus::Pending); result.is_error()) {
        return result;
    }
    info_.progress = 0;
    ++info_.network_retries;
    return upo::Ok();
}

upo::Result<void> UploadEntry::reset_for_retry() {
    if (info_.status != FileStatus::Error) {
        return upo::Err<void>(std::string("Only failed entries can be retried: ") + info_.id);
    }
    if (auto result = transition_to(FileStatus::Pending); result.is_error()) {
        return result;
    }
    info_.progress = 0;
    info_.error.reset();
    info_.retry_count = 0;
    info_.network_retries = 0;
    return upo::Ok();
}

bool UploadEntry::can_transition(FileStatus target) const noexcept {
    if (info_.status == FileStatus::Success) {
        return false;
    }
    return is_allowed(info_.status, target);
}

upo::Result<void> UploadEntry::transition_to(FileStatus next) {
    if (!can_transition(next)) {
        return upo::Err<void>(illegal(info_.status, next));
    }
    info_.status = next;
    last_transition_ = std::chrono::steady_clock::now();
    return upo::Ok();
}

} // namespace upo::upload
