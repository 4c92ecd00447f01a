#pragma once

#include "upo/core/result.hpp"
#include "upo/network/http_types.hpp"

#include <cctype>
#include <cstddef>
#include <exception>
#include <string>

namespace upo {
namespace network {

/**
 * @brief Parser states for an HTTP/1.x response
 *
 * HTTP-Version SP Status-Code SP Reason-Phrase CRLF
 * Header-Name: Header-Value CRLF
 * CRLF
 * [Body]   Content-Length, chunked, or read-until-close
 */
enum class ResponseParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    CHUNK_TRAILER,
    BODY_UNTIL_CLOSE,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP response parser
 *
 * Feed bytes as they arrive from the socket. When the server gives neither
 * Content-Length nor chunked encoding, the body runs until the connection
 * closes and the caller must call finish_on_eof().
 *
 * Usage:
 * ```cpp
 * HttpResponseParser parser;
 * for (;;) {
 *     auto n = socket.read_some(buffer, ec);
 *     if (ec == eof) { parser.finish_on_eof(); break; }
 *     auto done = parser.parse(buffer.data(), n);
 *     if (done.is_error()) { ... }
 *     if (done.value()) break;
 * }
 * HttpResponse response = parser.get_response();
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    /**
     * @return true once the response is complete, false if more data is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            if (state_ == ResponseParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ResponseParseState::PARSE_ERROR) {
                return Err<bool, std::string>("Parser in error state");
            }

            if (!step(data[i])) {
                const std::string where = describe_state(state_);
                state_ = ResponseParseState::PARSE_ERROR;
                return Err<bool, std::string>("Malformed HTTP response (" + where + ") at line " +
                                              std::to_string(line_));
            }

            if (data[i] == '\n') {
                ++line_;
            }
        }

        return Ok(state_ == ResponseParseState::COMPLETE);
    }

    /**
     * @brief Signal that the peer closed the connection
     *
     * Completes a read-until-close body. Anywhere else a close means the
     * response was truncated.
     */
    Result<bool> finish_on_eof() {
        if (state_ == ResponseParseState::COMPLETE) {
            return Ok(true);
        }
        if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
            state_ = ResponseParseState::COMPLETE;
            return Ok(true);
        }
        const std::string where = describe_state(state_);
        state_ = ResponseParseState::PARSE_ERROR;
        return Err<bool, std::string>("Connection closed before response was complete (" + where + ")");
    }

    const HttpResponse& get_response() const { return response_; }

    bool is_complete() const { return state_ == ResponseParseState::COMPLETE; }

    bool headers_complete() const {
        return state_ != ResponseParseState::VERSION &&
               state_ != ResponseParseState::STATUS_CODE &&
               state_ != ResponseParseState::REASON &&
               state_ != ResponseParseState::HEADER_NAME &&
               state_ != ResponseParseState::HEADER_VALUE;
    }

    void reset() {
        state_ = ResponseParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        remaining_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ResponseParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    size_t remaining_;              // Bytes left in the body or current chunk
    size_t line_;
    bool last_char_was_cr_;

    bool step(char c) {
        switch (state_) {
            case ResponseParseState::VERSION: return parse_version(c);
            case ResponseParseState::STATUS_CODE: return parse_status_code(c);
            case ResponseParseState::REASON: return parse_reason(c);
            case ResponseParseState::HEADER_NAME: return parse_header_name(c);
            case ResponseParseState::HEADER_VALUE: return parse_header_value(c);
            case ResponseParseState::BODY: return parse_body(c);
            case ResponseParseState::CHUNK_SIZE: return parse_chunk_size(c);
            case ResponseParseState::CHUNK_DATA: return parse_chunk_data(c);
            case ResponseParseState::CHUNK_DATA_END: return parse_chunk_data_end(c);
            case ResponseParseState::CHUNK_TRAILER: return parse_chunk_trailer(c);
            case ResponseParseState::BODY_UNTIL_CLOSE:
                response_.body.push_back(static_cast<uint8_t>(c));
                return true;
            case ResponseParseState::COMPLETE:
            case ResponseParseState::PARSE_ERROR:
                return false;
        }
        return false;
    }

    // Returns true when `c` completed a CRLF. A bare CR followed by anything
    // else is rejected through `ok`.
    bool consume_crlf(char c, bool& ok) {
        if (c == '\r') {
            if (last_char_was_cr_) {
                ok = false;
            }
            last_char_was_cr_ = true;
            return false;
        }
        if (c == '\n') {
            ok = last_char_was_cr_;
            last_char_was_cr_ = false;
            return ok;
        }
        if (last_char_was_cr_) {
            ok = false;
        }
        return false;
    }

    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ == "HTTP/1.1") {
                response_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                response_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            state_ = ResponseParseState::STATUS_CODE;
            return true;
        }
        if (buffer_.size() >= 8 || !std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return false;
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            state_ = ResponseParseState::REASON;
            // Reason phrase may be empty: "HTTP/1.1 429\r\n"
            return c == ' ' ? true : parse_reason(c);
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        bool ok = true;
        if (consume_crlf(c, ok)) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        if (!ok) {
            return false;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool parse_header_name(char c) {
        bool ok = true;
        if (consume_crlf(c, ok)) {
            if (!buffer_.empty()) {
                return false;
            }
            return begin_body();
        }
        if (!ok) {
            return false;
        }
        if (c == '\r') {
            return buffer_.empty();
        }

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        bool ok = true;
        if (consume_crlf(c, ok)) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            response_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        if (!ok) {
            return false;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool begin_body() {
        const std::string encoding = response_.get_header("Transfer-Encoding");
        if (!encoding.empty()) {
            if (encoding.find("chunked") == std::string::npos) {
                return false;
            }
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }

        const std::string content_length = response_.get_header("Content-Length");
        if (!content_length.empty()) {
            if (!parse_size(content_length, 10, remaining_)) {
                return false;
            }
            if (remaining_ == 0) {
                state_ = ResponseParseState::COMPLETE;
                return true;
            }
            response_.body.reserve(remaining_);
            state_ = ResponseParseState::BODY;
            return true;
        }

        // 204 and 304 never carry a body
        if (response_.status_code == 204 || response_.status_code == 304) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }

        state_ = ResponseParseState::BODY_UNTIL_CLOSE;
        return true;
    }

    bool parse_body(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (--remaining_ == 0) {
            state_ = ResponseParseState::COMPLETE;
        }
        return true;
    }

    bool parse_chunk_size(char c) {
        bool ok = true;
        if (consume_crlf(c, ok)) {
            // Chunk extensions after ';' are ignored
            const std::string size_text = buffer_.substr(0, buffer_.find(';'));
            buffer_.clear();
            if (!parse_size(size_text, 16, remaining_)) {
                return false;
            }
            state_ = remaining_ == 0 ? ResponseParseState::CHUNK_TRAILER : ResponseParseState::CHUNK_DATA;
            return true;
        }
        if (!ok) {
            return false;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool parse_chunk_data(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (--remaining_ == 0) {
            state_ = ResponseParseState::CHUNK_DATA_END;
        }
        return true;
    }

    bool parse_chunk_data_end(char c) {
        bool ok = true;
        if (consume_crlf(c, ok)) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }
        return ok && c == '\r';
    }

    bool parse_chunk_trailer(char c) {
        bool ok = true;
        if (consume_crlf(c, ok)) {
            if (buffer_.empty()) {
                state_ = ResponseParseState::COMPLETE;
            }
            buffer_.clear();
            return true;
        }
        if (!ok) {
            return false;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    static bool parse_size(const std::string& text, int base, size_t& out) {
        if (text.empty()) {
            return false;
        }
        try {
            size_t consumed = 0;
            out = static_cast<size_t>(std::stoull(text, &consumed, base));
            return consumed == text.size();
        } catch (const std::exception&) {
            return false;
        }
    }

    static std::string describe_state(ResponseParseState state) {
        switch (state) {
            case ResponseParseState::VERSION: return "version";
            case ResponseParseState::STATUS_CODE: return "status code";
            case ResponseParseState::REASON: return "reason phrase";
            case ResponseParseState::HEADER_NAME: return "header name";
            case ResponseParseState::HEADER_VALUE: return "header value";
            case ResponseParseState::BODY:
            case ResponseParseState::BODY_UNTIL_CLOSE: return "body";
            case ResponseParseState::CHUNK_SIZE:
            case ResponseParseState::CHUNK_DATA:
            case ResponseParseState::CHUNK_DATA_END:
            case ResponseParseState::CHUNK_TRAILER: return "chunked body";
            default: return "response";
        }
    }
};

} // namespace network
} // namespace upo
