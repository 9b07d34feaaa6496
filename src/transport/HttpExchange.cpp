#include "HttpExchange.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include "Error.hpp"
#include "spdlog/spdlog.h"

namespace b2core {

// ============================================================================
// Constants & Configuration
// ============================================================================

// Buffer size for reading the body from the socket.
static constexpr size_t DEFAULT_CHUNK_SIZE = 64 * KILOBYTE;

using BodyParser = http::response_parser<http::buffer_body>;

namespace {

void close_stream(beast::tcp_stream& stream) {
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream.socket().close(ec);
}

/**
 * @brief Streams the body of a response whose header has already been parsed.
 */
class HttpBodySource : public ByteSource {
   public:
    HttpBodySource(std::unique_ptr<beast::tcp_stream> stream, beast::flat_buffer buffer,
                   std::unique_ptr<BodyParser> parser)
        : stream_(std::move(stream)),
          buffer_(std::move(buffer)),
          parser_(std::move(parser)),
          chunk_(DEFAULT_CHUNK_SIZE) {}

    ~HttpBodySource() override { close_stream(*stream_); }

    asio::awaitable<std::optional<Bytes>> next_chunk() override {
        while (!parser_->is_done()) {
            auto& body = parser_->get().body();
            body.data = chunk_.data();
            body.size = chunk_.size();

            auto [ec, _] = co_await http::async_read(*stream_, buffer_, *parser_,
                                                     asio::as_tuple(asio::use_awaitable));
            // need_buffer only means our chunk is full
            if (ec == http::error::need_buffer) ec = {};
            if (ec) {
                close_stream(*stream_);
                throw TransportError("reading response body", ec);
            }

            size_t got = chunk_.size() - parser_->get().body().size;
            total_ += got;
            if (got > 0) {
                co_return Bytes(chunk_.begin(), chunk_.begin() + static_cast<std::ptrdiff_t>(got));
            }
        }

        spdlog::trace("[http] body complete, {} bytes", total_);
        close_stream(*stream_);
        co_return std::nullopt;
    }

   private:
    std::unique_ptr<beast::tcp_stream> stream_;
    beast::flat_buffer buffer_;
    std::unique_ptr<BodyParser> parser_;
    Bytes chunk_;
    size_t total_ = 0;
};

}  // namespace

// ============================================================================
// HttpExchange
// ============================================================================

HttpExchange::HttpExchange(asio::any_io_executor ex, HttpTarget target,
                           http::request<http::string_body> request)
    : target_(std::move(target)),
      request_(std::move(request)),
      resolver_(ex),
      stream_(std::make_unique<beast::tcp_stream>(ex)) {
    if (request_.find(http::field::host) == request_.end()) {
        request_.set(http::field::host, target_.host);
    }
}

HttpExchange::~HttpExchange() {
    if (stream_) cleanup_socket();
}

asio::awaitable<void> HttpExchange::connect() {
    spdlog::debug("[http] connecting to {}:{}", target_.host, target_.port);

    auto [ec_resolve, results] = co_await resolver_.async_resolve(
        target_.host, target_.port, asio::as_tuple(asio::use_awaitable));
    if (ec_resolve) {
        throw TransportError("resolving " + target_.host, ec_resolve);
    }

    stream_->expires_after(target_.connect_timeout);
    auto [ec_connect, _] =
        co_await stream_->async_connect(results, asio::as_tuple(asio::use_awaitable));
    if (ec_connect) {
        throw TransportError("connecting to " + target_.host + ":" + target_.port, ec_connect);
    }

    spdlog::debug("[http] connected to {}:{}", target_.host, target_.port);
}

asio::awaitable<void> HttpExchange::write_request_and_read_header() {
    request_.prepare_payload();

    auto [ec_write, written] =
        co_await http::async_write(*stream_, request_, asio::as_tuple(asio::use_awaitable));
    if (ec_write) {
        throw TransportError("writing request", ec_write);
    }
    spdlog::trace("[http] {} {} sent ({} bytes)", request_.method_string(), request_.target(),
                  written);

    parser_ = std::make_unique<BodyParser>();
    parser_->body_limit(std::numeric_limits<std::uint64_t>::max());

    auto [ec_read, _] = co_await http::async_read_header(*stream_, buffer_, *parser_,
                                                         asio::as_tuple(asio::use_awaitable));
    if (ec_read) {
        throw TransportError("reading response header", ec_read);
    }
}

asio::awaitable<Response> HttpExchange::response() {
    if (started_) {
        throw std::logic_error("HttpExchange::response() called twice");
    }
    started_ = true;

    try {
        co_await connect();

        // The body phase can take arbitrarily long (large downloads).
        co_await write_request_and_read_header();
        stream_->expires_never();
    } catch (const TransportError& e) {
        spdlog::debug("[http] exchange with {} failed: {}", target_.host, e.what());
        cleanup_socket();
        throw;
    }

    const auto& header = parser_->get();
    Response response;
    response.head.status = header.result_int();
    for (const auto& field : header.base()) {
        response.head.headers.insert(field.name_string(), field.value());
    }
    spdlog::debug("[http] {} {} -> {}", request_.method_string(), request_.target(),
                  response.head.status);

    response.body = std::make_unique<HttpBodySource>(std::move(stream_), std::move(buffer_),
                                                     std::move(parser_));
    co_return response;
}

void HttpExchange::cleanup_socket() {
    close_stream(*stream_);
}

}  // namespace b2core
