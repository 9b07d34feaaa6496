#pragma once

#include <memory>
#include <optional>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/fields.hpp>

#include "Types.hpp"

namespace b2core {

/**
 * @brief Status line and headers of a response.
 */
struct ResponseHead {
    unsigned status = 0;
    http::fields headers;

    bool is_success() const noexcept { return status >= 200 && status <= 299; }
};

/**
 * @brief A lazy, finite sequence of byte chunks.
 *
 * @details
 * **Contract:**
 * `next_chunk()` yields the chunks in order, then `std::nullopt` once the data is
 * exhausted. A failure surfaces as a thrown `TransportError`. Implementations are
 * single-owner: at most one `next_chunk()` may be outstanding at a time.
 * Destroying the source releases whatever it reads from (socket, file).
 */
class ByteSource {
   public:
    virtual ~ByteSource() = default;

    virtual asio::awaitable<std::optional<Bytes>> next_chunk() = 0;
};

/**
 * @brief What a PendingExchange resolves to: the head, plus a source for the body.
 */
struct Response {
    ResponseHead head;
    std::unique_ptr<ByteSource> body;
};

/**
 * @brief An HTTP exchange that has been started but whose response has not arrived.
 *
 * @details
 * `response()` completes exactly once, either with the response or by throwing a
 * `TransportError`. Calling it a second time is a precondition violation and throws
 * `std::logic_error`. Destroying a pending exchange cancels it.
 */
class PendingExchange {
   public:
    virtual ~PendingExchange() = default;

    virtual asio::awaitable<Response> response() = 0;
};

}  // namespace b2core
