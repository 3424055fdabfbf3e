#pragma once

#include "mload/network/http_types.hpp"
#include "mload/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace mload {
namespace network {

/**
 * @brief Position of the parser inside an HTTP/1.x request
 *
 * METHOD SP URL SP VERSION CRLF    <- request line
 * Header-Name: Header-Value CRLF   <- headers (repeated)
 * CRLF                             <- end of headers
 * [Body]                           <- Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR   // PARSE_ERROR rather than ERROR, which Windows defines as a macro
};

/**
 * @brief Incremental HTTP request parser
 *
 * Data is fed as it arrives from the socket; parse() returns true once a
 * full request has been read. The request line and headers are consumed
 * character by character, the body is copied in bulk.
 *
 * SIZE LIMIT:
 * `max_request_bytes` bounds the whole request (head + body). A request
 * that exceeds it, or announces a Content-Length that would exceed it, is
 * rejected and payload_too_large() becomes true so the server can answer
 * 413 instead of 400. Zero disables the limit.
 *
 * Usage:
 * ```cpp
 * HttpParser parser(4 * 1024 * 1024);
 * auto result = parser.parse(data, len);
 * if (result.is_error()) { ... }
 * if (result.value()) { HttpRequest request = parser.get_request(); }
 * ```
 */
class HttpParser {
public:
    explicit HttpParser(std::size_t max_request_bytes = 0) : max_request_bytes_(max_request_bytes) {
        reset();
    }

    /**
     * @return true when the request is complete, false when more data is needed;
     *         an error for malformed or oversized requests
     */
    Result<bool> parse(const char* data, std::size_t len) {
        std::size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool, std::string>("Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                const std::size_t wanted = content_length_ - request_.body.size();
                const std::size_t take = std::min(wanted, len - i);
                request_.body.insert(request_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + i),
                                     reinterpret_cast<const uint8_t*>(data + i + take));
                i += take;
                if (request_.body.size() == content_length_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[i++];
            ++head_bytes_;
            if (max_request_bytes_ != 0 && head_bytes_ > max_request_bytes_) {
                return fail_too_large("Request head exceeds " + std::to_string(max_request_bytes_) + " bytes");
            }
            if (c == '\n') {
                line_++;
            }

            switch (state_) {
                case ParseState::METHOD:
                    if (!parse_method(c)) {
                        return fail("Failed to parse HTTP method at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::URL:
                    if (!parse_url(c)) {
                        return fail("Failed to parse URL at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::VERSION:
                    if (!parse_version(c)) {
                        return fail("Failed to parse HTTP version at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::HEADER_NAME: {
                    auto res = parse_header_name(c);
                    if (res.is_error()) {
                        return res;
                    }
                    break;
                }

                case ParseState::HEADER_VALUE:
                    if (!parse_header_value(c)) {
                        return fail("Failed to parse header value at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::BODY:
                case ParseState::COMPLETE:
                case ParseState::PARSE_ERROR:
                    break;
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    HttpRequest get_request() const {
        return request_;
    }

    /// Moves the request out; the parser must be reset() before reuse
    HttpRequest take_request() {
        return std::move(request_);
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    bool payload_too_large() const {
        return payload_too_large_;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        content_length_ = 0;
        head_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        payload_too_large_ = false;
    }

private:
    std::size_t max_request_bytes_;
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::size_t content_length_;
    std::size_t head_bytes_;
    std::size_t line_;
    bool last_char_was_cr_;
    bool payload_too_large_;

    Result<bool> fail(std::string message) {
        state_ = ParseState::PARSE_ERROR;
        return Err<bool, std::string>(std::move(message));
    }

    Result<bool> fail_too_large(std::string message) {
        payload_too_large_ = true;
        return fail(std::move(message));
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    /// Content-Length must be all digits; nullopt-like false on overflow or junk
    static bool parse_content_length(const std::string& text, std::size_t& out) {
        if (text.empty()) {
            return false;
        }
        std::size_t value = 0;
        for (char c : text) {
            if (c < '0' || c > '9') {
                return false;
            }
            const std::size_t digit = static_cast<std::size_t>(c - '0');
            if (value > (static_cast<std::size_t>(-1) - digit) / 10) {
                return false;
            }
            value = value * 10 + digit;
        }
        out = value;
        return true;
    }

    Result<bool> parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return Ok(false);
        }

        if (c == '\n' && last_char_was_cr_) {
            // Blank line: headers done
            last_char_was_cr_ = false;
            const std::string header = request_.get_header("Content-Length");
            if (header.empty()) {
                state_ = ParseState::COMPLETE;
                return Ok(false);
            }
            std::size_t length = 0;
            if (!parse_content_length(header, length)) {
                return fail("Invalid Content-Length: " + header);
            }
            if (max_request_bytes_ != 0 && length > max_request_bytes_ - std::min(head_bytes_, max_request_bytes_)) {
                return fail_too_large("Request body of " + std::to_string(length) +
                                      " bytes exceeds the " + std::to_string(max_request_bytes_) + " byte limit");
            }
            content_length_ = length;
            if (length == 0) {
                state_ = ParseState::COMPLETE;
            } else {
                request_.body.reserve(length);
                state_ = ParseState::BODY;
            }
            return Ok(false);
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("Empty header name at line " + std::to_string(line_));
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return Ok(false);
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return fail("Failed to parse header name at line " + std::to_string(line_));
        }
        buffer_ += c;
        return Ok(false);
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && c == ' ') {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }
};

} // namespace network
} // namespace mload
