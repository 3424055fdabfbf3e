#pragma once

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace mload {
namespace network {

/**
 * @brief Request methods the upload API understands
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a Windows macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,  // Connection closes after the response unless keep-alive is asked for
    HTTP_1_1,  // Keep-alive by default
    UNKNOWN
};

/**
 * @brief Status codes produced by the server and the API routes
 *
 * 409 reports a state-machine conflict, 413 a request above the configured
 * message ceiling, 422 a well-formed request whose data failed verification.
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,
    PAYLOAD_TOO_LARGE = 413,
    UNPROCESSABLE_ENTITY = 422,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503
};

/**
 * @brief Parsed HTTP/1.x request
 *
 * `url` is the request target exactly as received, query string included.
 * The body is kept as bytes: chunk uploads carry raw binary payloads.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /// Header value by case-insensitive name; empty when absent
    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    /// Text view of the body; only meaningful for text payloads such as JSON
    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    /// Target without the query string: "/api/x?a=1" -> "/api/x"
    std::string path() const {
        const auto pos = url.find('?');
        return pos == std::string::npos ? url : url.substr(0, pos);
    }

    /// Raw query string without '?': "/api/x?a=1" -> "a=1"
    std::string query() const {
        const auto pos = url.find('?');
        return pos == std::string::npos ? std::string{} : url.substr(pos + 1);
    }
};

/**
 * @brief HTTP/1.x response
 *
 * HTTP/1.1 200 OK\r\n
 * Content-Type: application/json\r\n
 * Content-Length: 13\r\n
 * \r\n
 * {"ok": true}
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    /// Sets the body and Content-Length
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(const std::vector<uint8_t>& data) {
        body = data;
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    /// Status line, headers, blank line, body
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " " << status_code << " " << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";

        const std::string head = oss.str();
        std::vector<uint8_t> result(head.begin(), head.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::CONFLICT: return "Conflict";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::UNPROCESSABLE_ENTITY: return "Unprocessable Entity";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        }
        return "Unknown";
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            case HttpVersion::HTTP_1_1: return "HTTP/1.1";
            default: return "HTTP/1.1";
        }
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

} // namespace network
} // namespace mload
