#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

#include <boost/asio/awaitable.hpp>

#include "Exchange.hpp"
#include "IncrementalJsonDecoder.hpp"
#include "ResponseSupport.hpp"
#include "Types.hpp"
#include "config.hpp"
#include "spdlog/spdlog.h"

namespace b2core {

/**
 * @brief Turns a pending exchange whose body is a JSON list into a sequence of T,
 * yielding each element as soon as its bytes have arrived.
 *
 * @details
 * States: `Connecting` -> `Collecting(body, decoder)` on 2xx, or
 * `CollectingError(head, body, bytes)` otherwise -> `Done`. In `Collecting` every step
 * first asks the IncrementalJsonDecoder for a buffered element and only pulls more bytes
 * when it has none. An error response is read completely and thrown as `ApiError`.
 *
 * `next()` returns the elements in body order, then nullopt. Calling it after that, or
 * after it threw, or while another `next()` on it is suspended, throws
 * `std::logic_error`.
 */
template <typename T>
class StreamingResponseDecoder {
   public:
    /**
     * @param level Nesting depth of the list (1 = bare array).
     * @param capacity Bytes reserved up front for one element.
     * @param max_prealloc Cap on the bytes reserved for an error body.
     */
    StreamingResponseDecoder(std::unique_ptr<PendingExchange> exchange, std::uint32_t level,
                             std::size_t capacity = 0,
                             std::size_t max_prealloc = MAX_BODY_PREALLOC)
        : state_(Connecting{std::move(exchange)}),
          level_(level),
          capacity_(capacity),
          max_prealloc_(max_prealloc) {
        if (level_ == 0) {
            throw std::invalid_argument("StreamingResponseDecoder: level must be at least 1");
        }
    }

    static StreamingResponseDecoder fail(std::exception_ptr error) {
        return StreamingResponseDecoder(FailImmediately{std::move(error)});
    }

    template <typename E>
    static StreamingResponseDecoder fail(E error) {
        return fail(std::make_exception_ptr(std::move(error)));
    }

    StreamingResponseDecoder(StreamingResponseDecoder&&) noexcept = default;
    StreamingResponseDecoder& operator=(StreamingResponseDecoder&&) noexcept = default;
    StreamingResponseDecoder(const StreamingResponseDecoder&) = delete;
    StreamingResponseDecoder& operator=(const StreamingResponseDecoder&) = delete;

    asio::awaitable<std::optional<T>> next() {
        AdvanceGuard guard(advancing_, "StreamingResponseDecoder");
        if (std::holds_alternative<Done>(state_)) {
            throw std::logic_error("StreamingResponseDecoder polled after completion");
        }

        State state = std::exchange(state_, Done{});
        for (;;) {
            Transition step = co_await advance(std::move(state));
            state = std::move(step.next);
            if (step.ready) {
                state_ = std::move(state);
                co_return std::move(step.item);
            }
        }
    }

    bool is_done() const noexcept { return std::holds_alternative<Done>(state_); }

   private:
    struct Connecting {
        std::unique_ptr<PendingExchange> exchange;
    };
    struct Collecting {
        std::unique_ptr<ByteSource> body;
        IncrementalJsonDecoder<T> elements;
    };
    struct CollectingError {
        ResponseHead head;
        std::unique_ptr<ByteSource> body;
        Bytes bytes;
    };
    struct FailImmediately {
        std::exception_ptr error;
    };
    struct Done {};

    using State = std::variant<Connecting, Collecting, CollectingError, FailImmediately, Done>;

    // `ready` ends the current next() with `item` (nullopt = end of the list).
    struct Transition {
        State next;
        bool ready = false;
        std::optional<T> item;
    };

    explicit StreamingResponseDecoder(FailImmediately failed)
        : state_(std::move(failed)), level_(1), capacity_(0), max_prealloc_(0) {}

    asio::awaitable<Transition> advance(State state) {
        if (auto* connecting = std::get_if<Connecting>(&state)) {
            Response response = co_await connecting->exchange->response();

            if (response.head.is_success()) {
                co_return Transition{
                    Collecting{std::move(response.body),
                               IncrementalJsonDecoder<T>(level_, capacity_)},
                    false, std::nullopt};
            }
            Bytes bytes;
            bytes.reserve(body_preallocation(response.head, max_prealloc_));
            co_return Transition{
                CollectingError{std::move(response.head), std::move(response.body),
                                std::move(bytes)},
                false, std::nullopt};
        }

        if (auto* collecting = std::get_if<Collecting>(&state)) {
            if (auto item = collecting->elements.next()) {
                co_return Transition{std::move(state), true, std::move(item)};
            }
            if (auto chunk = co_await collecting->body->next_chunk()) {
                collecting->elements.push(*chunk);
                co_return Transition{std::move(state), false, std::nullopt};
            }
            if (!collecting->elements.balanced()) {
                throw DecodeError("response body ended in the middle of the list");
            }
            spdlog::trace("[decode] list complete");
            co_return Transition{Done{}, true, std::nullopt};
        }

        if (auto* failed_body = std::get_if<CollectingError>(&state)) {
            if (auto chunk = co_await failed_body->body->next_chunk()) {
                failed_body->bytes.insert(failed_body->bytes.end(), chunk->begin(),
                                          chunk->end());
                co_return Transition{std::move(state), false, std::nullopt};
            }
            throw make_api_error(failed_body->head, failed_body->bytes);
        }

        if (auto* failed = std::get_if<FailImmediately>(&state)) {
            std::rethrow_exception(failed->error);
        }

        throw std::logic_error("StreamingResponseDecoder advanced from the Done state");
    }

    State state_;
    std::uint32_t level_;
    std::size_t capacity_;
    std::size_t max_prealloc_;
    bool advancing_ = false;
};

/**
 * @brief Starts decoding the list found `level` deep in the body of `exchange`.
 */
template <typename T>
StreamingResponseDecoder<T> decode_stream(std::unique_ptr<PendingExchange> exchange,
                                          std::uint32_t level, std::size_t capacity = 0,
                                          std::size_t max_prealloc = MAX_BODY_PREALLOC) {
    return StreamingResponseDecoder<T>(std::move(exchange), level, capacity, max_prealloc);
}

}  // namespace b2core
