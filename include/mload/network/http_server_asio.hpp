#pragma once

#include "mload/network/http_parser.hpp"
#include "mload/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace mload {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief One accepted connection: read a request, run the handler, reply, close
 *
 * Lifecycle:
 * 1. Created by the acceptor and owned through shared_ptr
 * 2. Every pending async operation holds a shared_from_this() copy
 * 3. Destroyed once the last operation completes
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_request_bytes);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);

    /// Parse failures answer 400, oversized requests 413
    void handle_error(HttpStatus status, const std::string& message);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Event-driven HTTP server on a Boost.Asio io_context
 *
 * Thread safety:
 * - The io_context may be run from several threads; connections are
 *   independent, so the handler can be called concurrently
 * - The handler must be safe for concurrent calls (ModelService locks)
 *
 * Usage:
 * ```cpp
 * asio::io_context io;
 * HttpServerAsio server(io, "0.0.0.0", 8080, 4 * 1024 * 1024);
 * server.set_handler([&](const HttpRequest& req) { return router.handle_request(req); });
 * io.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param address IPv4/IPv6 literal to bind
     * @param port 0 picks an ephemeral port (see get_port())
     * @param max_request_bytes per-request ceiling (head + body)
     *
     * Throws boost::system::system_error when the address cannot be bound.
     */
    HttpServerAsio(asio::io_context& io_context,
                   const std::string& address,
                   uint16_t port,
                   std::size_t max_request_bytes);

    void set_handler(HttpRequestHandler handler);

    /// Stop accepting; connections in flight complete
    void stop();

    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::size_t max_request_bytes_;
    uint16_t port_;
};

} // namespace network
} // namespace mload
