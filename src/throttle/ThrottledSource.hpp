#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include "Exchange.hpp"
#include "TokenBucket.hpp"
#include "Types.hpp"
#include "config.hpp"

namespace b2core {

/**
 * @brief A ByteSource that rate limits another one with a TokenBucket.
 *
 * @details
 * Chunks are never reordered or altered, only delayed and split. While the bucket holds
 * fewer tokens than the next chunk and fewer than TokenBucket::MIN_SLICE, the pull
 * waits on a timer (created on the puller's executor the first time it is needed);
 * otherwise as much of the chunk as the tokens allow goes out and the rest is kept for
 * the next pull. A rate of 0 passes every chunk through untouched.
 *
 * When constructed with a shared stream counter (see Throttle), the stream counts itself
 * as active from its first pull until it is destroyed, and every refill earns
 * `rate / active streams`.
 *
 * Errors of the wrapped source propagate unchanged.
 */
class ThrottledSource : public ByteSource {
   public:
    using StreamCounter = std::shared_ptr<std::atomic<std::size_t>>;

    /**
     * @throws std::invalid_argument if bucket_size is below MIN_BUCKET_SIZE.
     */
    ThrottledSource(std::unique_ptr<ByteSource> inner, std::uint64_t rate,
                    std::size_t bucket_size, StreamCounter active_streams = nullptr);

    ~ThrottledSource() override;

    ThrottledSource(const ThrottledSource&) = delete;
    ThrottledSource& operator=(const ThrottledSource&) = delete;

    asio::awaitable<std::optional<Bytes>> next_chunk() override;

    // Rate in bytes per second, 0 = unlimited.
    void set_rate(std::uint64_t rate) noexcept { bucket_.set_rate(rate); }

    /**
     * @throws std::invalid_argument if bucket_size is below MIN_BUCKET_SIZE.
     */
    void set_bucket_size(std::size_t bucket_size) { bucket_.set_capacity(bucket_size); }

    /**
     * @brief Unwraps the source: the bytes pulled but not yet emitted, and the wrapped
     * source. This object must not be pulled afterwards.
     */
    std::pair<std::optional<Bytes>, std::unique_ptr<ByteSource>> into_inner();

    /**
     * @brief Counts this stream as active before its first pull, so streams already
     * running share the rate with it from now on. No-op without a shared counter or
     * when already registered.
     */
    void register_stream() noexcept;

    /**
     * @brief Stops counting an idle stream as active. Its next pull registers it again.
     */
    void unregister_stream() noexcept;

    bool registered() const noexcept { return registered_; }

   private:
    std::size_t divisor() const noexcept;

    // Next `count` bytes of the pending chunk.
    Bytes emit(std::size_t count);

    std::unique_ptr<ByteSource> inner_;
    TokenBucket bucket_;

    std::optional<Bytes> pending_;
    std::size_t pending_offset_ = 0;

    std::optional<asio::steady_timer> timer_;

    StreamCounter active_streams_;
    bool registered_ = false;
};

/**
 * @brief Wraps `source` in its own token bucket.
 */
std::unique_ptr<ThrottledSource> throttle(std::unique_ptr<ByteSource> source,
                                          std::uint64_t rate,
                                          std::size_t capacity = DEFAULT_BUCKET_SIZE);

}  // namespace b2core
