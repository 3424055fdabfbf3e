#pragma once

#include "mload/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mload {
namespace network {

/**
 * @brief Request plus the parameters extracted while routing
 *
 * `params` holds path captures (`/chunks/:index`), `query` the decoded
 * query string (`?batch_size=5`).
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;
    std::unordered_map<std::string, std::string> query;

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }

    std::string get_query(const std::string& name, const std::string& default_value = "") const {
        auto it = query.find(name);
        return (it != query.end()) ? it->second : default_value;
    }

    bool has_query(const std::string& name) const {
        return query.find(name) != query.end();
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/// Returns false to short-circuit with the response it filled in
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // "/api/model/chunks/:index"
    std::regex regex;
    std::vector<std::string> param_names;  // ["index"]
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    /// Matches the path only; the query string is stripped by the router
    bool matches_path(const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + path dispatcher with `:param` captures
 *
 * @code
 * HttpRouter router;
 * router.put("/api/model/chunks/:index", [](const HttpContext& ctx) {
 *     auto index = ctx.get_param("index");
 *     ...
 * });
 * router.post("/api/model/initialize/continue", [](const HttpContext& ctx) {
 *     auto batch = ctx.get_query("batch_size");
 *     ...
 * });
 * @endcode
 *
 * A path that matches some route under another method answers 405;
 * a path that matches nothing goes to the not-found handler.
 * Handler exceptions are logged and turned into 500.
 */
class HttpRouter {
public:
    HttpRouter();

    // ────────────────────────────────────────────────────────────
    // Route Registration
    // ────────────────────────────────────────────────────────────

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    // ────────────────────────────────────────────────────────────
    // Middleware and fallbacks
    // ────────────────────────────────────────────────────────────

    /// Runs in registration order before the matched handler
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    // ────────────────────────────────────────────────────────────
    // Request Handling
    // ────────────────────────────────────────────────────────────

    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;
    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);
    static HttpResponse method_not_allowed(const HttpContext& ctx);
};

// ────────────────────────────────────────────────────────────
// Helper Functions
// ────────────────────────────────────────────────────────────

/**
 * @brief Convert a route pattern to an anchored regex
 *
 *   "/api/model/chunks/:index" -> "^/api/model/chunks/([^/]+)$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

/// Percent-decoding with '+' as space; malformed escapes are kept verbatim
std::string url_decode(const std::string& text);

/// "a=1&b=x%20y" -> {a: "1", b: "x y"}; a key without '=' maps to ""
std::unordered_map<std::string, std::string> parse_query(const std::string& query);

} // namespace network
} // namespace mload
