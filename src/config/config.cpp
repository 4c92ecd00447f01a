#include "upo/config/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace upo::config {
namespace {

using json = nlohmann::json;

upo::Result<void> type_error(const std::string& key, const char* expected) {
    return upo::Err<void>("Config key '" + key + "' must be " + expected);
}

// Reads `key` from `object` into `out` when present; leaves `out` alone otherwise
template<typename T>
upo::Result<void> read(const json& object, const std::string& prefix, const char* key, T& out) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return upo::Ok();
    }
    const std::string path = prefix.empty() ? key : prefix + "." + key;

    if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean()) {
            return type_error(path, "a boolean");
        }
        out = it->get<bool>();
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (!it->is_string()) {
            return type_error(path, "a string");
        }
        out = it->get<std::string>();
    } else {
        static_assert(std::is_unsigned_v<T>, "config numbers are unsigned");
        if (!it->is_number_unsigned()) {
            return type_error(path, "a non-negative integer");
        }
        const auto value = it->get<std::uint64_t>();
        if (value > std::numeric_limits<T>::max()) {
            return type_error(path, "within range");
        }
        out = static_cast<T>(value);
    }
    return upo::Ok();
}

// Durations are bounded so that deadlines built from them (now + value, in
// steady_clock ticks) cannot overflow
template<typename Duration>
upo::Result<void> read_duration(const json& object, const std::string& prefix, const char* key, Duration& out) {
    std::uint64_t count = static_cast<std::uint64_t>(out.count());
    if (auto res = read(object, prefix, key, count); res.is_error()) {
        return res;
    }

    const auto limit = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::duration::max() / 2);
    if (count > static_cast<std::uint64_t>(limit.count())) {
        const std::string path = prefix.empty() ? key : prefix + "." + key;
        return type_error(path, "within range");
    }
    out = Duration(static_cast<typename Duration::rep>(count));
    return upo::Ok();
}

upo::Result<void> read_optional_string(const json& object, const std::string& prefix, const char* key,
                                       std::optional<std::string>& out) {
    std::string value = out.value_or("");
    auto result = read(object, prefix, key, value);
    if (result.is_ok() && object.contains(key)) {
        out = value.empty() ? std::nullopt : std::optional<std::string>(value);
    }
    return result;
}

upo::Result<void> read_top_level(const json& root, SchedulerConfig& config) {
    if (auto res = read(root, "", "max_concurrent", config.max_concurrent); res.is_error()) {
        return res;
    }
    if (auto res = read_duration(root, "", "upload_timeout_seconds", config.upload_timeout); res.is_error()) {
        return res;
    }
    return read(root, "", "log_level", config.log_level);
}

upo::Result<void> read_compression(const json& object, SchedulerConfig& config) {
    if (auto res = read(object, "compression", "enabled", config.compression_enabled); res.is_error()) {
        return res;
    }
    if (auto res = read(object, "compression", "threshold_bytes", config.compression_threshold_bytes);
        res.is_error()) {
        return res;
    }
    if (auto res = read(object, "compression", "max_output_bytes", config.compression_max_output_bytes);
        res.is_error()) {
        return res;
    }
    if (auto res = read(object, "compression", "mime_prefix", config.compress_mime_prefix); res.is_error()) {
        return res;
    }
    return read(object, "compression", "max_dimension", config.max_dimension);
}

upo::Result<void> read_retry(const json& object, SchedulerConfig& config) {
    if (auto res = read_duration(object, "retry", "default_retry_after_seconds", config.default_retry_after);
        res.is_error()) {
        return res;
    }
    if (auto res = read(object, "retry", "max_rate_limit_retries", config.max_rate_limit_retries); res.is_error()) {
        return res;
    }
    if (auto res = read(object, "retry", "max_network_retries", config.max_network_retries); res.is_error()) {
        return res;
    }
    if (auto res = read_duration(object, "retry", "initial_backoff_ms", config.initial_backoff); res.is_error()) {
        return res;
    }
    return read_duration(object, "retry", "max_backoff_ms", config.max_backoff);
}

upo::Result<void> read_upload(const json& object, SchedulerConfig& config) {
    if (auto res = read(object, "upload", "entity_type", config.upload.entity_type); res.is_error()) {
        return res;
    }
    if (auto res = read(object, "upload", "entity_id", config.upload.entity_id); res.is_error()) {
        return res;
    }
    if (auto res = read_optional_string(object, "upload", "category", config.upload.category); res.is_error()) {
        return res;
    }
    return read_optional_string(object, "upload", "file_type", config.upload.file_type);
}

upo::Result<void> read_transport(const json& object, SchedulerConfig& config) {
    auto& transport = config.transport;
    if (auto res = read(object, "transport", "host", transport.host); res.is_error()) {
        return res;
    }
    if (auto res = read(object, "transport", "port", transport.port); res.is_error()) {
        return res;
    }
    if (auto res = read(object, "transport", "endpoint", transport.endpoint); res.is_error()) {
        return res;
    }
    if (auto res = read(object, "transport", "auth_token", transport.auth_token); res.is_error()) {
        return res;
    }
    if (auto res = read(object, "transport", "chunk_size", transport.chunk_size); res.is_error()) {
        return res;
    }
    if (auto res = read_duration(object, "transport", "connect_timeout_ms", transport.connect_timeout);
        res.is_error()) {
        return res;
    }
    return read_duration(object, "transport", "io_timeout_ms", transport.io_timeout);
}

// Applies `reader` to the named section when the root carries one
upo::Result<void> read_section(const json& root, const char* key, SchedulerConfig& config,
                               upo::Result<void> (*reader)(const json&, SchedulerConfig&)) {
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return upo::Ok();
    }
    if (!it->is_object()) {
        return type_error(key, "an object");
    }
    return reader(*it, config);
}

} // namespace

upload::CompressionOptions SchedulerConfig::compression_options() const {
    upload::CompressionOptions options;
    options.threshold_bytes = compression_threshold_bytes;
    options.max_output_bytes = compression_max_output_bytes;
    options.max_dimension = max_dimension;
    options.mime_prefix = compress_mime_prefix;
    return options;
}

network::HttpTransportOptions SchedulerConfig::transport_options() const {
    network::HttpTransportOptions options;
    options.endpoint.host = transport.host;
    options.endpoint.port = transport.port;
    options.endpoint.path = transport.endpoint;
    options.endpoint.auth_token = transport.auth_token;
    options.chunk_size = transport.chunk_size;
    options.connect_timeout = transport.connect_timeout;
    options.io_timeout = transport.io_timeout;
    options.default_retry_after = default_retry_after;
    return options;
}

upo::Result<SchedulerConfig> parse_config(const std::string& json_text) {
    json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded()) {
        return upo::Err<SchedulerConfig>(std::string("Config is not valid JSON"));
    }
    if (!root.is_object()) {
        return upo::Err<SchedulerConfig>(std::string("Config root must be a JSON object"));
    }

    SchedulerConfig config;

    if (auto res = read_top_level(root, config); res.is_error()) {
        return upo::Err<SchedulerConfig>(res.error());
    }
    if (auto res = read_section(root, "compression", config, read_compression); res.is_error()) {
        return upo::Err<SchedulerConfig>(res.error());
    }
    if (auto res = read_section(root, "retry", config, read_retry); res.is_error()) {
        return upo::Err<SchedulerConfig>(res.error());
    }
    if (auto res = read_section(root, "upload", config, read_upload); res.is_error()) {
        return upo::Err<SchedulerConfig>(res.error());
    }
    if (auto res = read_section(root, "transport", config, read_transport); res.is_error()) {
        return upo::Err<SchedulerConfig>(res.error());
    }

    return upo::Ok(std::move(config));
}

upo::Result<SchedulerConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return upo::Err<SchedulerConfig>("Failed to open config file: " + path.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();

    auto parsed = parse_config(contents.str());
    if (parsed.is_error()) {
        return upo::Err<SchedulerConfig>(path.string() + ": " + parsed.error());
    }
    spdlog::debug("[Config] loaded {}", path.string());
    return parsed;
}

upo::Result<void> validate(const SchedulerConfig& config) {
    if (config.max_concurrent == 0) {
        return upo::Err<void>(std::string("max_concurrent must be at least 1"));
    }
    if (config.upload.entity_type.empty()) {
        return upo::Err<void>(std::string("upload.entity_type is required"));
    }
    if (config.upload.entity_id.empty()) {
        return upo::Err<void>(std::string("upload.entity_id is required"));
    }
    if (config.max_backoff < config.initial_backoff) {
        return upo::Err<void>(std::string("retry.max_backoff_ms must not be below retry.initial_backoff_ms"));
    }
    if (config.transport.chunk_size == 0) {
        return upo::Err<void>(std::string("transport.chunk_size must be positive"));
    }
    if (config.transport.host.empty()) {
        return upo::Err<void>(std::string("transport.host is required"));
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        return upo::Err<void>("Unknown log_level: " + config.log_level);
    }
    return upo::Ok();
}

} // namespace upo::config
