#pragma once
#include <chrono>
#include <memory>
#include <string>

// --- Boost.Asio Includes ---
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

// --- Boost.Beast Includes ---
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>

#include "Exchange.hpp"
#include "Types.hpp"

namespace b2core {

/**
 * @brief Where an HttpExchange connects to.
 */
struct HttpTarget {
    std::string host;
    std::string port = "80";
    std::chrono::seconds connect_timeout{15};  // NOLINT
};

/**
 * @brief A "one-shot" HTTP/1.1 exchange over plain TCP, built on Boost.Beast.
 *
 * @details
 * **Role:**
 * Resolves, connects, writes the request and reads the response header. The
 * connection is then handed to the body ByteSource, which streams the body with a
 * `buffer_body` parser (Content-Length and chunked encoding alike), so the body is
 * never held in memory as a whole.
 *
 * **Ownership:**
 * Until `response()` completes the exchange owns the socket; afterwards the returned
 * body source does. Destroying whichever owns it closes the socket.
 */
class HttpExchange : public PendingExchange {
   public:
    /**
     * @param ex The executor all I/O of this exchange runs on.
     * @param target Host, port and connect timeout.
     * @param request The request to send. Its Host header is filled in if missing.
     */
    HttpExchange(asio::any_io_executor ex, HttpTarget target,
                 http::request<http::string_body> request);

    ~HttpExchange() override;

    asio::awaitable<Response> response() override;

   private:
    // --- Coroutine Helpers ---

    /**
     * @brief Resolves the host and connects the TCP socket.
     */
    asio::awaitable<void> connect();

    /**
     * @brief Writes the request and reads the response header into `parser_`.
     * Body bytes that arrived with the header stay in `buffer_`.
     */
    asio::awaitable<void> write_request_and_read_header();

    /**
     * @brief Closes the socket, ignoring errors.
     */
    void cleanup_socket();

    HttpTarget target_;
    http::request<http::string_body> request_;
    tcp::resolver resolver_;
    std::unique_ptr<beast::tcp_stream> stream_;
    beast::flat_buffer buffer_;

    std::unique_ptr<http::response_parser<http::buffer_body>> parser_;
    bool started_ = false;
};

}  // namespace b2core
