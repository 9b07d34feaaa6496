#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace b2core {

/**
 * @brief Token bucket arithmetic, without any I/O. One token is one byte.
 *
 * @details
 * Tokens come back at `rate` per second (divided by the number of streams sharing the
 * rate) up to `capacity`. All arithmetic saturates, so long idle gaps and very high
 * rates cannot overflow.
 */
class TokenBucket {
   public:
    using Clock = std::chrono::steady_clock;

    // Below this many tokens a chunk that does not fit is held back instead of sliced.
    static constexpr std::size_t MIN_SLICE = 1024;

    /**
     * @param rate Bytes per second.
     * @param capacity Bucket size; the bucket starts full.
     * @throws std::invalid_argument if capacity is below MIN_BUCKET_SIZE.
     */
    TokenBucket(std::uint64_t rate, std::size_t capacity, Clock::time_point now = Clock::now());

    /**
     * @brief Adds the tokens earned since the last refill.
     * @param divisor Number of streams sharing the rate (at least 1).
     */
    void refill(Clock::time_point now, std::size_t divisor = 1);

    /**
     * @brief How long to wait before `remaining` bytes may be (partly) sent.
     * Zero when a slice can go out right away.
     */
    std::chrono::milliseconds wait_for(std::size_t remaining, std::size_t divisor = 1) const;

    /**
     * @brief Consumes up to `wanted` tokens and returns how many were taken.
     */
    std::size_t take(std::size_t wanted) noexcept;

    void set_rate(std::uint64_t rate) noexcept { rate_ = rate; }
    void set_capacity(std::size_t capacity);

    std::uint64_t rate() const noexcept { return rate_; }
    std::size_t capacity() const noexcept { return capacity_; }
    std::size_t tokens() const noexcept { return tokens_; }

   private:
    std::uint64_t rate_;
    std::size_t capacity_;
    std::size_t tokens_;
    Clock::time_point last_refill_;
};

}  // namespace b2core
