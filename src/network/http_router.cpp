#include "mload/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace mload {
namespace network {

// ────────────────────────────────────────────────────────────
// Helpers
// ────────────────────────────────────────────────────────────

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    size_t i = 0;

    while (i < pattern.length()) {
        if (pattern[i] == ':') {
            ++i;
            std::string param_name;
            while (i < pattern.length() &&
                   (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
                param_name += pattern[i];
                ++i;
            }
            if (!param_name.empty()) {
                param_names.push_back(param_name);
                regex_pattern += "([^/]+)";
            }
        } else if (pattern[i] == '*') {
            regex_pattern += "(.*)";
            ++i;
        } else {
            const char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' ||
                c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                c == '|' || c == '\\') {
                regex_pattern += '\\';
            }
            regex_pattern += c;
            ++i;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size() &&
                   hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::unordered_map<std::string, std::string> parse_query(const std::string& query) {
    std::unordered_map<std::string, std::string> result;
    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }
        const std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            if (eq == std::string::npos) {
                result[url_decode(pair)] = "";
            } else {
                result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        start = end + 1;
    }
    return result;
}

// ────────────────────────────────────────────────────────────
// Route
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), handler(std::move(h)) {
    // param_names is filled while the pattern is translated
    regex = std::regex(pattern_to_regex(pattern, param_names));
}

bool Route::matches_path(const std::string& path) const {
    return std::regex_match(path, regex);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;
    if (std::regex_match(path, match, regex)) {
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = url_decode(match[i + 1].str());
        }
    }
    return params;
}

// ────────────────────────────────────────────────────────────
// HttpRouter
// ────────────────────────────────────────────────────────────

HttpRouter::HttpRouter() : not_found_handler_(default_not_found_handler) {}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::put(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::PUT, pattern, std::move(handler));
}

void HttpRouter::delete_(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::DELETE_METHOD, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);
    ctx.query = parse_query(request.query());
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const std::string path = request.path();
    const Route* route = nullptr;
    bool path_known = false;
    for (const auto& candidate : routes_) {
        if (!candidate.matches_path(path)) {
            continue;
        }
        path_known = true;
        if (candidate.method == request.method) {
            route = &candidate;
            break;
        }
    }

    if (route == nullptr) {
        return path_known ? method_not_allowed(ctx) : not_found_handler_(ctx);
    }

    ctx.params = route->extract_params(path);
    try {
        return route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Handler for {} {} threw: {}", HttpMethodUtils::to_string(request.method), path, e.what());
        HttpResponse error(HttpStatus::INTERNAL_SERVER_ERROR);
        error.set_body(nlohmann::json{{"error", "InternalError"}, {"message", e.what()}}.dump());
        error.set_header("Content-Type", "application/json");
        return error;
    }
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    for (const auto& route : routes_) {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(route.method) << " " << route.pattern;
        route_list.push_back(oss.str());
    }
    return route_list;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    HttpResponse response(HttpStatus::NOT_FOUND);
    response.set_body(nlohmann::json{{"error", "NotFound"},
                                     {"message", "No route for " + ctx.request.path()}}.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

HttpResponse HttpRouter::method_not_allowed(const HttpContext& ctx) {
    HttpResponse response(HttpStatus::METHOD_NOT_ALLOWED);
    response.set_body(nlohmann::json{{"error", "MethodNotAllowed"},
                                     {"message", HttpMethodUtils::to_string(ctx.request.method) +
                                                 " is not supported on " + ctx.request.path()}}.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

} // namespace network
} // namespace mload
