#pragma once

#include <cstddef>
#include <string_view>

#include <boost/asio/awaitable.hpp>

#include "Exchange.hpp"
#include "IncrementalJsonDecoder.hpp"
#include "config.hpp"
#include "Types.hpp"

namespace b2core {

/**
 * @brief Declared Content-Length of a response, 0 when absent or unparsable.
 */
std::size_t content_length(const ResponseHead& head) noexcept;

/**
 * @brief Bytes to reserve for a body: the declared length, capped at `max_prealloc`.
 */
std::size_t body_preallocation(const ResponseHead& head,
                               std::size_t max_prealloc = MAX_BODY_PREALLOC) noexcept;

/**
 * @brief Builds the ApiError for a non-success response from its complete body.
 * @throws DecodeError if the body is not a service error object.
 */
ApiError make_api_error(const ResponseHead& head, const Bytes& body);

/**
 * @brief Reads `body` to the end, appending to `into`.
 */
asio::awaitable<void> read_to_end(ByteSource& body, Bytes& into);

inline std::string_view as_text(const Bytes& bytes) noexcept {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

/**
 * @brief Marks a decoder as being advanced for the lifetime of the guard.
 *
 * @details
 * A decoder is owned by exactly one task. Two coroutines advancing the same decoder
 * would interleave their reads of the body, so the second one is refused with
 * `std::logic_error` instead.
 */
class AdvanceGuard {
   public:
    AdvanceGuard(bool& flag, const char* who);
    ~AdvanceGuard() { flag_ = false; }

    AdvanceGuard(const AdvanceGuard&) = delete;
    AdvanceGuard& operator=(const AdvanceGuard&) = delete;

   private:
    bool& flag_;
};

}  // namespace b2core
