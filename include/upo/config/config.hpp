#pragma once

#include "upo/core/result.hpp"
#include "upo/network/http_transport.hpp"
#include "upo/upload/compression.hpp"
#include "upo/upload/transport.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace upo::config {

struct TransportConfig {
    std::string host = "localhost";
    unsigned short port = 80;
    std::string endpoint = "/api/v2/uploads";
    std::string auth_token;
    std::size_t chunk_size = 64 * 1024;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds io_timeout{120000};
};

/**
 * @brief Everything the scheduler and the HTTP transport need to run
 *
 * Defaults match the web client this orchestrator replaces: two uploads at
 * a time, compress images above 1 MiB, 30 s pause when the server
 * rate-limits without saying for how long.
 */
struct SchedulerConfig {
    std::uint32_t max_concurrent = 2;

    bool compression_enabled = true;
    std::uint64_t compression_threshold_bytes = 1024 * 1024;
    std::uint64_t compression_max_output_bytes = 1024 * 1024;
    std::string compress_mime_prefix = "image/";
    std::uint32_t max_dimension = 2000;

    std::chrono::seconds default_retry_after{30};
    std::uint32_t max_rate_limit_retries = 5;
    std::uint32_t max_network_retries = 3;
    std::chrono::milliseconds initial_backoff{2000};
    std::chrono::milliseconds max_backoff{60000};
    std::chrono::seconds upload_timeout{0};   ///< 0 disables the per-upload timeout

    upload::UploadMetadata upload;
    TransportConfig transport;

    std::string log_level = "info";

    [[nodiscard]] upload::CompressionOptions compression_options() const;
    [[nodiscard]] network::HttpTransportOptions transport_options() const;
};

/**
 * @brief Parse a JSON document into a config
 *
 * Missing keys keep their defaults and unknown keys are ignored. A key with
 * the wrong JSON type is reported by name. Durations are given in the unit
 * their key names (`*_seconds`, `*_ms`).
 */
upo::Result<SchedulerConfig> parse_config(const std::string& json_text);

upo::Result<SchedulerConfig> load_config(const std::filesystem::path& path);

/// Semantic checks that JSON typing cannot express
upo::Result<void> validate(const SchedulerConfig& config);

} // namespace upo::config
