#include "TokenBucket.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include "config.hpp"

namespace b2core {

namespace {

constexpr std::uint64_t NANOS_PER_SECOND = 1'000'000'000ULL;

std::uint64_t saturating_mul(std::uint64_t a, std::uint64_t b) noexcept {
    if (a != 0 && b > std::numeric_limits<std::uint64_t>::max() / a) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return a * b;
}

std::size_t saturating_add(std::size_t a, std::size_t b) noexcept {
    if (b > std::numeric_limits<std::size_t>::max() - a) {
        return std::numeric_limits<std::size_t>::max();
    }
    return a + b;
}

std::size_t saturating_to_size(std::uint64_t value) noexcept {
    if (value > std::numeric_limits<std::size_t>::max()) {
        return std::numeric_limits<std::size_t>::max();
    }
    return static_cast<std::size_t>(value);
}

void check_capacity(std::size_t capacity) {
    if (capacity < MIN_BUCKET_SIZE) {
        throw std::invalid_argument("bucket size must be at least " +
                                    std::to_string(MIN_BUCKET_SIZE) + " bytes, got " +
                                    std::to_string(capacity));
    }
}

}  // namespace

TokenBucket::TokenBucket(std::uint64_t rate, std::size_t capacity, Clock::time_point now)
    : rate_(rate), capacity_(capacity), tokens_(capacity), last_refill_(now) {
    check_capacity(capacity);
}

void TokenBucket::refill(Clock::time_point now, std::size_t divisor) {
    if (now <= last_refill_) return;

    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(now - last_refill_);
    auto nanos = static_cast<std::uint64_t>(elapsed.count());
    std::uint64_t earned = saturating_mul(nanos, rate_) / NANOS_PER_SECOND;

    std::size_t share = saturating_to_size(earned) / std::max<std::size_t>(divisor, 1);
    tokens_ = std::min(capacity_, saturating_add(tokens_, share));
    last_refill_ = now;
}

std::chrono::milliseconds TokenBucket::wait_for(std::size_t remaining,
                                                std::size_t divisor) const {
    if (rate_ == 0 || tokens_ >= remaining || tokens_ >= MIN_SLICE) {
        return std::chrono::milliseconds{0};
    }

    std::size_t needed = std::min(capacity_, remaining - tokens_);
    std::uint64_t effective_rate =
        std::max<std::uint64_t>(rate_ / std::max<std::size_t>(divisor, 1), 1);

    // Round up, and never wait zero: needed is at least 1 here.
    std::uint64_t millis = 1 + (saturating_mul(needed, 1000) - 1) / effective_rate;
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(
        std::min<std::uint64_t>(millis, std::numeric_limits<std::int64_t>::max()))};
}

std::size_t TokenBucket::take(std::size_t wanted) noexcept {
    std::size_t taken = std::min(tokens_, wanted);
    tokens_ -= taken;
    return taken;
}

void TokenBucket::set_capacity(std::size_t capacity) {
    check_capacity(capacity);
    capacity_ = capacity;
    tokens_ = std::min(tokens_, capacity_);
}

}  // namespace b2core
