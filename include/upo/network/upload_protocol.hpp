#pragma once

#include "upo/core/result.hpp"
#include "upo/network/http_types.hpp"
#include "upo/upload/transport.hpp"
#include "upo/upload/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace upo {
namespace network {

/**
 * @brief Where and how upload requests are addressed
 */
struct UploadEndpoint {
    std::string host;
    unsigned short port = 80;
    std::string path = "/api/v2/uploads";
    std::string auth_token;  ///< Sent as "Authorization: Bearer <token>" when non-empty
};

/**
 * @brief Build the multipart POST for one file
 *
 * Parts: `file` (bytes, original filename, content type), then the text
 * fields entityType, entityId and, when set, category and fileType.
 */
HttpRequest build_upload_request(const upload::SourceFile& source,
                                 const upload::UploadMetadata& metadata,
                                 const UploadEndpoint& endpoint,
                                 const std::string& boundary);

/// Random boundary that will not collide with file content in practice
std::string make_boundary();

/**
 * @brief Parse a Retry-After header given in delta-seconds
 *
 * HTTP-date values and garbage yield nullopt so the caller falls back to
 * the response body or the configured default.
 */
std::optional<std::chrono::seconds> parse_retry_after(const std::string& header_value);

/**
 * @brief Map a server response onto the transport contract
 *
 * - 2xx with {"file":{"url","key"}}     -> UploadReceipt
 * - 2xx without a url                   -> ServerError "No URL returned from server"
 * - 429                                 -> RateLimited, delay from Retry-After,
 *                                          else body retryAfterSeconds, else default
 * - other 4xx / 5xx                     -> ClientError / ServerError with body
 *                                          "message" or "Upload failed (HTTP <code>)"
 */
upo::Result<upload::UploadReceipt, upload::TransportError>
classify_response(const HttpResponse& response, std::chrono::seconds default_retry_after);

} // namespace network
} // namespace upo
