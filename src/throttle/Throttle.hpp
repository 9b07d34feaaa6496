#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "Exchange.hpp"
#include "ThrottledSource.hpp"
#include "config.hpp"

namespace b2core {

/**
 * @brief Shares one rate fairly between every stream it wraps.
 *
 * Each wrapped stream keeps its own bucket but earns `rate / active streams`, where the
 * count is one atomic shared by every copy of the Throttle and every stream made from
 * it. Changing the defaults only affects streams wrapped afterwards.
 */
class Throttle {
   public:
    /**
     * @throws std::invalid_argument if bucket_size is below MIN_BUCKET_SIZE.
     */
    explicit Throttle(std::uint64_t rate, std::size_t bucket_size = DEFAULT_BUCKET_SIZE);
    explicit Throttle(const ThrottleConfig& cfg) : Throttle(cfg.rate, cfg.bucket_size) {}

    std::unique_ptr<ThrottledSource> wrap(std::unique_ptr<ByteSource> source) const;

    void set_default_rate(std::uint64_t rate) noexcept { rate_ = rate; }
    void set_default_bucket_size(std::size_t bucket_size);

    std::uint64_t default_rate() const noexcept { return rate_; }
    std::size_t default_bucket_size() const noexcept { return bucket_size_; }

    // Streams that have started pulling and are still alive.
    std::size_t active_streams() const noexcept {
        return active_streams_->load(std::memory_order_acquire);
    }

   private:
    ThrottledSource::StreamCounter active_streams_;
    std::uint64_t rate_;
    std::size_t bucket_size_;
};

}  // namespace b2core
