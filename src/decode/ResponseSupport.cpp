#include "ResponseSupport.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string>

#include "spdlog/spdlog.h"

namespace b2core {

std::size_t content_length(const ResponseHead& head) noexcept {
    auto it = head.headers.find(http::field::content_length);
    if (it == head.headers.end()) return 0;

    std::string_view value = it->value();
    std::size_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc{} || ptr != value.data() + value.size()) return 0;
    return length;
}

std::size_t body_preallocation(const ResponseHead& head, std::size_t max_prealloc) noexcept {
    return std::min(content_length(head), max_prealloc);
}

ApiError make_api_error(const ResponseHead& head, const Bytes& body) {
    auto message = decode_json<ApiErrorMessage>(as_text(body));
    spdlog::debug("[decode] service error {} ({}): {}", head.status, message.code,
                  message.message);
    return ApiError(head.status, std::move(message));
}

asio::awaitable<void> read_to_end(ByteSource& body, Bytes& into) {
    while (auto chunk = co_await body.next_chunk()) {
        into.insert(into.end(), chunk->begin(), chunk->end());
    }
}

AdvanceGuard::AdvanceGuard(bool& flag, const char* who) : flag_(flag) {
    if (flag_) {
        throw std::logic_error(std::string(who) + " advanced while already being advanced");
    }
    flag_ = true;
}

}  // namespace b2core
