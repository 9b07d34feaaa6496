#include "ThrottledSource.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "spdlog/spdlog.h"

namespace b2core {

ThrottledSource::ThrottledSource(std::unique_ptr<ByteSource> inner, std::uint64_t rate,
                                 std::size_t bucket_size, StreamCounter active_streams)
    : inner_(std::move(inner)),
      bucket_(rate, bucket_size),
      active_streams_(std::move(active_streams)) {
    if (!inner_) {
        throw std::invalid_argument("ThrottledSource: source must not be null");
    }
}

ThrottledSource::~ThrottledSource() { unregister_stream(); }

asio::awaitable<std::optional<Bytes>> ThrottledSource::next_chunk() {
    if (!inner_) {
        throw std::logic_error("ThrottledSource pulled after into_inner()");
    }

    if (!pending_) {
        auto chunk = co_await inner_->next_chunk();
        if (!chunk) {
            co_return std::nullopt;
        }
        pending_ = std::move(chunk);
        pending_offset_ = 0;
    }

    std::size_t remaining = pending_->size() - pending_offset_;
    if (bucket_.rate() == 0) {
        co_return emit(remaining);
    }

    // Registering first keeps the divisor at 1 or more.
    register_stream();

    for (;;) {
        bucket_.refill(TokenBucket::Clock::now(), divisor());
        auto wait = bucket_.wait_for(remaining, divisor());
        if (wait.count() == 0) {
            break;
        }

        if (!timer_) {
            timer_.emplace(co_await asio::this_coro::executor);
        }
        spdlog::trace("[throttle] {} bytes pending, {} tokens, waiting {} ms", remaining,
                      bucket_.tokens(), wait.count());
        timer_->expires_after(wait);
        co_await timer_->async_wait(asio::use_awaitable);
    }

    co_return emit(bucket_.take(remaining));
}

Bytes ThrottledSource::emit(std::size_t count) {
    auto first = pending_->begin() + static_cast<std::ptrdiff_t>(pending_offset_);
    Bytes out(first, first + static_cast<std::ptrdiff_t>(count));

    pending_offset_ += count;
    if (pending_offset_ == pending_->size()) {
        pending_.reset();
        pending_offset_ = 0;
    }
    return out;
}

std::pair<std::optional<Bytes>, std::unique_ptr<ByteSource>> ThrottledSource::into_inner() {
    std::optional<Bytes> unsent;
    if (pending_) {
        unsent.emplace(pending_->begin() + static_cast<std::ptrdiff_t>(pending_offset_),
                       pending_->end());
        pending_.reset();
        pending_offset_ = 0;
    }
    unregister_stream();
    return {std::move(unsent), std::move(inner_)};
}

void ThrottledSource::register_stream() noexcept {
    if (active_streams_ && !registered_) {
        active_streams_->fetch_add(1, std::memory_order_acq_rel);
        registered_ = true;
    }
}

void ThrottledSource::unregister_stream() noexcept {
    if (active_streams_ && registered_) {
        active_streams_->fetch_sub(1, std::memory_order_acq_rel);
        registered_ = false;
    }
}

std::size_t ThrottledSource::divisor() const noexcept {
    if (!active_streams_) return 1;
    return std::max<std::size_t>(active_streams_->load(std::memory_order_acquire), 1);
}

std::unique_ptr<ThrottledSource> throttle(std::unique_ptr<ByteSource> source,
                                          std::uint64_t rate, std::size_t capacity) {
    return std::make_unique<ThrottledSource>(std::move(source), rate, capacity);
}

}  // namespace b2core
