#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "Error.hpp"
#include "MemorySource.hpp"
#include "ScriptedExchange.hpp"
#include "StreamUtil.hpp"
#include "TestHarness.hpp"
#include "Throttle.hpp"
#include "ThrottledSource.hpp"

namespace b2core {

using namespace std::chrono_literals;
using test::run_coro;
using test::ScriptedSource;

namespace {

using Clock = std::chrono::steady_clock;

Bytes pattern(std::size_t size) {
    Bytes data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>(i * 31 + 7);
    }
    return data;
}

// Drains `source` and reports how long it took.
asio::awaitable<std::pair<Bytes, Clock::duration>> timed_collect(ByteSource& source) {
    auto start = Clock::now();
    Bytes out = co_await collect(source);
    co_return std::make_pair(std::move(out), Clock::now() - start);
}

}  // namespace

TEST(ThrottledSource, LimitsThroughput) {
    constexpr std::size_t SIZE = 128 * KILOBYTE;
    auto data = pattern(SIZE);
    auto source = throttle(std::make_unique<MemorySource>(data, 16 * KILOBYTE), SIZE, 8192);

    auto [out, elapsed] = run_coro(timed_collect(*source));

    EXPECT_EQ(out, data);
    // The first 8 KiB go out of the full bucket, the rest at 128 KiB/s.
    EXPECT_GE(elapsed, 850ms);
    EXPECT_LT(elapsed, 5s);
}

TEST(ThrottledSource, SplitsChunksLargerThanBucket) {
    auto data = pattern(16 * KILOBYTE);
    auto source = throttle(std::make_unique<MemorySource>(data, data.size()), 1 << 30, 4096);

    std::vector<std::size_t> sizes;
    Bytes joined;
    run_coro([&]() -> asio::awaitable<void> {
        while (auto chunk = co_await source->next_chunk()) {
            sizes.push_back(chunk->size());
            joined.insert(joined.end(), chunk->begin(), chunk->end());
        }
    }());

    EXPECT_EQ(joined, data);
    ASSERT_GE(sizes.size(), 4U);
    for (auto size : sizes) {
        EXPECT_LE(size, 4096U);
    }
}

TEST(ThrottledSource, ZeroRatePassesThrough) {
    auto source = throttle(std::make_unique<MemorySource>(pattern(100000), 50000), 0, 1024);

    auto first = run_coro(source->next_chunk());
    ASSERT_TRUE(first);
    EXPECT_EQ(first->size(), 50000U);
    EXPECT_FALSE(source->registered());
}

TEST(ThrottledSource, IntoInnerReturnsUnsentBytes) {
    auto data = pattern(16 * KILOBYTE);
    std::vector<Bytes> chunks{Bytes(data.begin(), data.begin() + 12 * KILOBYTE),
                              Bytes(data.begin() + 12 * KILOBYTE, data.end())};
    auto source = throttle(std::make_unique<MemorySource>(chunks), 1 << 20, 8192);

    asio::io_context ioc;
    auto first = run_coro(ioc, source->next_chunk());
    ASSERT_TRUE(first);
    EXPECT_EQ(first->size(), 8192U);

    auto [unsent, inner] = source->into_inner();
    ASSERT_TRUE(unsent);
    EXPECT_EQ(unsent->size(), 12 * KILOBYTE - 8192);
    ASSERT_TRUE(inner);

    Bytes rest = run_coro(ioc, collect(*inner));
    Bytes joined = *first;
    joined.insert(joined.end(), unsent->begin(), unsent->end());
    joined.insert(joined.end(), rest.begin(), rest.end());
    EXPECT_EQ(joined, data);

    EXPECT_THROW(run_coro(ioc, source->next_chunk()), std::logic_error);
}

TEST(ThrottledSource, SourceErrorsPropagate) {
    auto source = throttle(
        std::make_unique<ScriptedSource>(std::vector<std::string>{"abc"},
                                         asio::error::connection_reset),
        1 << 20);
    asio::io_context ioc;
    EXPECT_TRUE(run_coro(ioc, source->next_chunk()));
    EXPECT_THROW(run_coro(ioc, source->next_chunk()), TransportError);
}

TEST(ThrottledSource, RejectsInvalidArguments) {
    EXPECT_THROW(throttle(nullptr, 1000), std::invalid_argument);
    EXPECT_THROW(throttle(std::make_unique<MemorySource>(pattern(10), 10), 1000, 512),
                 std::invalid_argument);

    auto source = throttle(std::make_unique<MemorySource>(pattern(10), 10), 1000);
    EXPECT_THROW(source->set_bucket_size(100), std::invalid_argument);
    EXPECT_NO_THROW(source->set_bucket_size(MIN_BUCKET_SIZE));
}

TEST(Throttle, CountsActiveStreams) {
    Throttle shared(1 << 20);
    auto a = shared.wrap(std::make_unique<MemorySource>(pattern(4096), 1024));
    auto b = shared.wrap(std::make_unique<MemorySource>(pattern(4096), 1024));
    EXPECT_EQ(shared.active_streams(), 0U);

    asio::io_context ioc;
    run_coro(ioc, a->next_chunk());
    EXPECT_EQ(shared.active_streams(), 1U);
    run_coro(ioc, b->next_chunk());
    EXPECT_EQ(shared.active_streams(), 2U);

    // Copies of the throttle share the count.
    Throttle copy = shared;
    a.reset();
    EXPECT_EQ(copy.active_streams(), 1U);

    auto [unsent, inner] = b->into_inner();
    EXPECT_EQ(shared.active_streams(), 0U);
}

TEST(Throttle, ExplicitRegistration) {
    Throttle shared(1 << 20);
    auto a = shared.wrap(std::make_unique<MemorySource>(pattern(4096), 1024));

    a->register_stream();
    a->register_stream();
    EXPECT_TRUE(a->registered());
    EXPECT_EQ(shared.active_streams(), 1U);

    asio::io_context ioc;
    run_coro(ioc, a->next_chunk());
    EXPECT_EQ(shared.active_streams(), 1U);

    a->unregister_stream();
    EXPECT_FALSE(a->registered());
    EXPECT_EQ(shared.active_streams(), 0U);

    run_coro(ioc, a->next_chunk());
    EXPECT_EQ(shared.active_streams(), 1U);

    // Without a shared counter there is nothing to register with.
    auto alone = throttle(std::make_unique<MemorySource>(pattern(16), 16), 1 << 20);
    alone->register_stream();
    EXPECT_FALSE(alone->registered());
}

TEST(Throttle, SharesRateFairly) {
    constexpr std::size_t SIZE = 64 * KILOBYTE;
    Throttle shared(128 * KILOBYTE, 8192);
    auto first = shared.wrap(std::make_unique<MemorySource>(pattern(SIZE), 8 * KILOBYTE));
    auto second = shared.wrap(std::make_unique<MemorySource>(pattern(SIZE), 8 * KILOBYTE));

    asio::io_context ioc;
    auto a = asio::co_spawn(ioc, timed_collect(*first), asio::use_future);
    auto b = asio::co_spawn(ioc, timed_collect(*second), asio::use_future);
    ioc.run();

    auto [out_a, elapsed_a] = a.get();
    auto [out_b, elapsed_b] = b.get();
    EXPECT_EQ(out_a.size(), SIZE);
    EXPECT_EQ(out_b.size(), SIZE);

    // Each stream earns half the rate: 56 KiB after the first bucket at 64 KiB/s.
    EXPECT_GE(elapsed_a, 700ms);
    EXPECT_GE(elapsed_b, 700ms);
    auto spread = elapsed_a > elapsed_b ? elapsed_a - elapsed_b : elapsed_b - elapsed_a;
    EXPECT_LT(spread, 350ms);
}

TEST(Throttle, DefaultsApplyToLaterStreams) {
    Throttle shared(ThrottleConfig{1000, 4096});
    EXPECT_EQ(shared.default_rate(), 1000U);
    EXPECT_EQ(shared.default_bucket_size(), 4096U);

    shared.set_default_rate(0);
    auto source = shared.wrap(std::make_unique<MemorySource>(pattern(100000), 100000));
    auto chunk = run_coro(source->next_chunk());
    ASSERT_TRUE(chunk);
    EXPECT_EQ(chunk->size(), 100000U);

    EXPECT_THROW(shared.set_default_bucket_size(1), std::invalid_argument);
    EXPECT_EQ(shared.default_bucket_size(), 4096U);
    EXPECT_THROW(Throttle(1000, 1), std::invalid_argument);
}

}  // namespace b2core
