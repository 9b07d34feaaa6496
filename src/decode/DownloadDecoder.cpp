#include "DownloadDecoder.hpp"

#include <utility>

#include "ResponseSupport.hpp"
#include "spdlog/spdlog.h"

namespace b2core {

asio::awaitable<Download> start_download(std::unique_ptr<PendingExchange> exchange,
                                         std::size_t max_prealloc) {
    Response response = co_await exchange->response();

    if (!response.head.is_success()) {
        Bytes error_body;
        error_body.reserve(body_preallocation(response.head, max_prealloc));
        co_await read_to_end(*response.body, error_body);
        throw make_api_error(response.head, error_body);
    }

    spdlog::debug("[decode] download started, {} bytes announced",
                  content_length(response.head));
    co_return Download{std::move(response.head), std::move(response.body)};
}

}  // namespace b2core
