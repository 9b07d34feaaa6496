#pragma once

#include <cstddef>
#include <memory>

#include <boost/asio/awaitable.hpp>

#include "Exchange.hpp"
#include "Types.hpp"
#include "config.hpp"

namespace b2core {

/**
 * @brief A successful download: the response head and the unread body.
 */
struct Download {
    ResponseHead head;
    std::unique_ptr<ByteSource> body;
};

/**
 * @brief Awaits the response head of a download without reading the body.
 *
 * A non-success response is read completely and thrown as `ApiError`; at most
 * `max_prealloc` bytes are reserved for it up front.
 */
asio::awaitable<Download> start_download(std::unique_ptr<PendingExchange> exchange,
                                         std::size_t max_prealloc = MAX_BODY_PREALLOC);

}  // namespace b2core
