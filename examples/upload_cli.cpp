/**
 * @file upload_cli.cpp
 * @brief Upload a batch of local files through the orchestrator
 *
 * USAGE:
 *   upload_cli <config.json> <file>...
 *
 * WHAT IT SHOWS:
 * - Config loading and validation
 * - Duplicate detection before submission
 * - EventBus components (logger, metrics, notifications) observing the scheduler
 * - Rate-limit pauses surfacing as pause state
 */

#include "upo/config/config.hpp"
#include "upo/events/components.hpp"
#include "upo/events/event_bus.hpp"
#include "upo/network/http_transport.hpp"
#include "upo/upload/compression.hpp"
#include "upo/upload/content_hasher.hpp"
#include "upo/upload/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>

using namespace upo;
using namespace upo::upload;
using namespace upo::events;

// ════════════════════════════════════════════════════════════
// Global State
// ════════════════════════════════════════════════════════════

std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = true;
    }
}

// ════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════

std::string guess_mime_type(const std::filesystem::path& path) {
    static const std::map<std::string, std::string> types = {
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".bmp", "image/bmp"},
        {".heic", "image/heic"},
        {".pdf", "application/pdf"},
        {".txt", "text/plain"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    };

    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = types.find(extension);
    return it != types.end() ? it->second : "application/octet-stream";
}

Result<SourceFile> read_source(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<SourceFile>("Cannot open " + path.string());
    }

    SourceFile file;
    file.name = path.filename().string();
    file.mime_type = guess_mime_type(path);
    file.bytes.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err<SourceFile>("Read error on " + path.string());
    }
    return Ok(std::move(file));
}

void print_notifications(NotificationChannel& channel) {
    while (auto note = channel.queue().try_pop()) {
        if (note->kind == Notification::Kind::Success) {
            spdlog::info("✓ {} uploaded: {}", note->name, note->detail);
        } else {
            spdlog::error("✗ {} failed: {}", note->name, note->detail);
        }
    }
}

std::shared_ptr<CompressionAdapter> make_compression(const config::SchedulerConfig& cfg) {
    if (!cfg.compression_enabled) {
        return nullptr;
    }
    if (!DeflateCompressionAdapter::suits(cfg.compression_options())) {
        spdlog::warn("Compression disabled: deflate output is not an image (compression.mime_prefix='{}')",
                     cfg.compress_mime_prefix);
        return nullptr;
    }
    return std::make_shared<DeflateCompressionAdapter>();
}

// ════════════════════════════════════════════════════════════
// Main
// ════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 3) {
        spdlog::error("Usage: {} <config.json> <file>...", argv[0]);
        return 2;
    }

    auto loaded = config::load_config(argv[1]);
    if (loaded.is_error()) {
        spdlog::error("Failed to load config: {}", loaded.error());
        return 2;
    }
    config::SchedulerConfig cfg = std::move(loaded.value());

    auto valid = config::validate(cfg);
    if (valid.is_error()) {
        spdlog::error("Invalid config: {}", valid.error());
        return 2;
    }
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    spdlog::info("════════════════════════════════════════════");
    spdlog::info("Upload Orchestrator");
    spdlog::info("  target:      {}:{}{}", cfg.transport.host, cfg.transport.port, cfg.transport.endpoint);
    spdlog::info("  concurrency: {}", cfg.max_concurrent);
    spdlog::info("  entity:      {}/{}", cfg.upload.entity_type, cfg.upload.entity_id);
    spdlog::info("════════════════════════════════════════════");

    // ════════════════════════════════════════════════════════════
    // Read and de-duplicate the batch
    // ════════════════════════════════════════════════════════════

    std::vector<SourceFile> files;
    for (int i = 2; i < argc; ++i) {
        auto source = read_source(argv[i]);
        if (source.is_error()) {
            spdlog::error("{}", source.error());
            return 1;
        }
        files.push_back(std::move(source.value()));
    }

    ContentHasher hasher;
    const auto report = ContentHasher::find_duplicates(hasher.hash_batch(files), {});
    for (const auto& duplicate : report.duplicates) {
        spdlog::warn("Skipping {}: same content as an earlier file (sha256={})",
                     duplicate.name, duplicate.digest.substr(0, 12));
    }

    std::vector<SourceFile> unique;
    unique.reserve(report.unique.size());
    for (const auto& candidate : report.unique) {
        unique.push_back(std::move(files[candidate.index]));
    }

    // ════════════════════════════════════════════════════════════
    // Wire components and scheduler
    // ════════════════════════════════════════════════════════════

    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);
    NotificationChannel notifications(bus);

    auto transport = std::make_shared<network::HttpUploadTransport>(cfg.transport_options());
    auto compression = make_compression(cfg);

    UploadScheduler scheduler(cfg, transport, compression, bus);

    std::signal(SIGINT, signal_handler);

    scheduler.submit(std::move(unique));

    std::string last_reason;
    while (!scheduler.wait_for_idle(std::chrono::milliseconds(500))) {
        print_notifications(notifications);

        const auto pause = scheduler.pause_state();
        if (pause.paused && pause.reason != last_reason) {
            spdlog::warn("{}", pause.reason);
        }
        last_reason = pause.paused ? pause.reason : std::string();

        if (g_interrupted) {
            spdlog::warn("Interrupted, cancelling remaining uploads");
            scheduler.reset();
            break;
        }
    }
    print_notifications(notifications);

    // ════════════════════════════════════════════════════════════
    // Summary
    // ════════════════════════════════════════════════════════════

    const auto completed = scheduler.completed_files();
    spdlog::info("Completed files ({}):", completed.size());
    for (const auto& file : completed) {
        spdlog::info("  {} -> {} (key={})", file.name, file.url, file.key);
    }

    metrics.print_stats();

    return scheduler.counts().error > 0 ? 1 : 0;
}
