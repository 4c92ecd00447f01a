#include "upo/network/upload_protocol.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace upo {
namespace network {

using upload::StatusCategory;
using upload::TransportError;
using upload::UploadReceipt;

namespace {

using json = nlohmann::json;

upo::Result<UploadReceipt, TransportError> failure(StatusCategory category, int status, std::string message) {
    TransportError error;
    error.category = category;
    error.http_status = status;
    error.message = std::move(message);
    return upo::Err<UploadReceipt, TransportError>(std::move(error));
}

// Body is JSON on every documented path; anything else is treated as empty
json parse_body(const HttpResponse& response) {
    if (response.body.empty()) {
        return json::object();
    }
    json body = json::parse(response.body.begin(), response.body.end(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return json::object();
    }
    return body;
}

std::optional<std::string> string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::chrono::seconds> body_retry_after(const json& body) {
    auto it = body.find("retryAfterSeconds");
    if (it == body.end()) {
        return std::nullopt;
    }
    if (it->is_number_integer() && it->get<long long>() > 0) {
        return std::chrono::seconds(it->get<long long>());
    }
    if (it->is_number_float() && it->get<double>() > 0) {
        return std::chrono::seconds(static_cast<long long>(it->get<double>()));
    }
    if (it->is_string()) {
        return parse_retry_after(it->get<std::string>());
    }
    return std::nullopt;
}

} // namespace

HttpRequest build_upload_request(const upload::SourceFile& source,
                                 const upload::UploadMetadata& metadata,
                                 const UploadEndpoint& endpoint,
                                 const std::string& boundary) {
    MultipartBuilder form(boundary);
    form.add_file("file", source.name, source.mime_type, source.bytes);
    form.add_field("entityType", metadata.entity_type);
    form.add_field("entityId", metadata.entity_id);
    if (metadata.category && !metadata.category->empty()) {
        form.add_field("category", *metadata.category);
    }
    if (metadata.file_type && !metadata.file_type->empty()) {
        form.add_field("fileType", *metadata.file_type);
    }

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = endpoint.path.empty() ? "/" : endpoint.path;
    request.set_header("Host", endpoint.port == 80 ? endpoint.host
                                                   : endpoint.host + ":" + std::to_string(endpoint.port));
    request.set_header("Accept", "application/json");
    request.set_header("Connection", "close");
    request.set_header("Content-Type", form.content_type());
    if (!endpoint.auth_token.empty()) {
        request.set_header("Authorization", "Bearer " + endpoint.auth_token);
    }
    request.body = form.finish();
    return request;
}

std::string make_boundary() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << "----upo-boundary-" << std::hex << std::setw(16) << std::setfill('0') << rng();
    return oss.str();
}

std::optional<std::chrono::seconds> parse_retry_after(const std::string& header_value) {
    size_t begin = 0;
    size_t end = header_value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(header_value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(header_value[end - 1]))) {
        --end;
    }
    if (begin == end || end - begin > 9) {
        return std::nullopt;
    }

    long long seconds = 0;
    for (size_t i = begin; i < end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(header_value[i]))) {
            return std::nullopt;
        }
        seconds = seconds * 10 + (header_value[i] - '0');
    }
    if (seconds <= 0) {
        return std::nullopt;
    }
    return std::chrono::seconds(seconds);
}

upo::Result<UploadReceipt, TransportError>
classify_response(const HttpResponse& response, std::chrono::seconds default_retry_after) {
    const int status = response.status_code;
    const json body = parse_body(response);

    if (response.is_success()) {
        auto file_it = body.find("file");
        if (file_it == body.end() || !file_it->is_object()) {
            return failure(StatusCategory::ServerError, status, "No URL returned from server");
        }
        auto url = string_field(*file_it, "url");
        if (!url) {
            return failure(StatusCategory::ServerError, status, "No URL returned from server");
        }
        UploadReceipt receipt;
        receipt.url = std::move(*url);
        receipt.key = string_field(*file_it, "key").value_or("");
        return upo::Ok<UploadReceipt, TransportError>(std::move(receipt));
    }

    std::string message = string_field(body, "message")
        .value_or("Upload failed (HTTP " + std::to_string(status) + ")");

    if (status == static_cast<int>(HttpStatus::TOO_MANY_REQUESTS)) {
        auto delay = parse_retry_after(response.get_header("Retry-After"));
        if (!delay) {
            delay = body_retry_after(body);
        }
        TransportError error;
        error.category = StatusCategory::RateLimited;
        error.http_status = status;
        error.message = std::move(message);
        error.retry_after = std::chrono::duration_cast<std::chrono::milliseconds>(delay.value_or(default_retry_after));
        return upo::Err<UploadReceipt, TransportError>(std::move(error));
    }

    if (status >= 400 && status < 500) {
        return failure(StatusCategory::ClientError, status, std::move(message));
    }
    return failure(StatusCategory::ServerError, status, std::move(message));
}

} // namespace network
} // namespace upo
