#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace upo {
namespace network {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes the upload contract cares about
 *
 * Anything else is handled by range (2xx/4xx/5xx) in the classifier.
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    PAYLOAD_TOO_LARGE = 413,
    TOO_MANY_REQUESTS = 429,
    INTERNAL_SERVER_ERROR = 500,
    BAD_GATEWAY = 502,
    SERVICE_UNAVAILABLE = 503
};

using HeaderMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Case-insensitive header lookup (RFC 7230)
 *
 * Headers are stored as received; lookups ignore case.
 * @return Header value if found, empty string otherwise
 */
inline std::string find_header(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

inline std::string method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        default: return "UNKNOWN";
    }
}

inline std::string version_to_string(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        default: return "HTTP/1.1";
    }
}

/**
 * @brief Outgoing HTTP request
 *
 * Request-Line = Method SP Request-URI SP HTTP-Version CRLF
 * Headers = *(header-field CRLF)
 * CRLF
 * [ message-body ]
 *
 * The body is binary (file bytes inside a multipart envelope), hence
 * std::vector<uint8_t> rather than std::string.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::POST;
    std::string url = "/";
    HttpVersion version = HttpVersion::HTTP_1_1;
    HeaderMap headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    /// Request line and headers, terminated by the blank line. Content-Length is always emitted.
    std::string serialize_head() const {
        std::ostringstream oss;
        oss << method_to_string(method) << " " << url << " " << version_to_string(version) << "\r\n";
        for (const auto& [name, value] : headers) {
            if (strcasecmp(name.c_str(), "Content-Length") == 0) {
                continue;
            }
            oss << name << ": " << value << "\r\n";
        }
        oss << "Content-Length: " << body.size() << "\r\n";
        oss << "\r\n";
        return oss.str();
    }

    std::vector<uint8_t> serialize() const {
        const std::string head = serialize_head();
        std::vector<uint8_t> wire(head.begin(), head.end());
        wire.insert(wire.end(), body.begin(), body.end());
        return wire;
    }
};

/**
 * @brief Parsed HTTP response
 *
 * Status-Line = HTTP-Version SP Status-Code SP Reason-Phrase CRLF
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 0;
    std::string reason_phrase;
    HeaderMap headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @brief multipart/form-data body builder (RFC 7578)
 *
 * EXAMPLE:
 * MultipartBuilder form("----upo-boundary-1");
 * form.add_field("entityType", "property");
 * form.add_file("file", "photo.jpg", "image/jpeg", bytes);
 * request.body = form.finish();
 * request.set_header("Content-Type", form.content_type());
 */
class MultipartBuilder {
public:
    explicit MultipartBuilder(std::string boundary) : boundary_(std::move(boundary)) {}

    void add_field(const std::string& name, const std::string& value) {
        append("--" + boundary_ + "\r\n");
        append("Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n");
        append(value);
        append("\r\n");
    }

    void add_file(const std::string& name,
                  const std::string& filename,
                  const std::string& content_type,
                  const std::vector<uint8_t>& data) {
        append("--" + boundary_ + "\r\n");
        append("Content-Disposition: form-data; name=\"" + name + "\"; filename=\"" + escape(filename) + "\"\r\n");
        append("Content-Type: " + (content_type.empty() ? std::string("application/octet-stream") : content_type) + "\r\n\r\n");
        body_.insert(body_.end(), data.begin(), data.end());
        append("\r\n");
    }

    /// Appends the closing boundary and hands the body over
    std::vector<uint8_t> finish() {
        append("--" + boundary_ + "--\r\n");
        return std::move(body_);
    }

    std::string content_type() const {
        return "multipart/form-data; boundary=" + boundary_;
    }

    const std::string& boundary() const { return boundary_; }

private:
    void append(const std::string& text) {
        body_.insert(body_.end(), text.begin(), text.end());
    }

    static std::string escape(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (char c : value) {
            if (c == '"' || c == '\\') {
                out += '\\';
            }
            if (c == '\r' || c == '\n') {
                continue;
            }
            out += c;
        }
        return out;
    }

    std::string boundary_;
    std::vector<uint8_t> body_;
};

} // namespace network
} // namespace upo
