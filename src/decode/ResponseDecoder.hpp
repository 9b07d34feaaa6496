#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

#include <boost/asio/awaitable.hpp>

#include "Exchange.hpp"
#include "ResponseSupport.hpp"
#include "Types.hpp"
#include "config.hpp"

namespace b2core {

/**
 * @brief Turns a pending exchange into one decoded value of type T, or an error.
 *
 * @details
 * **State machine:**
 * `Connecting(exchange)` -> `Collecting(head, body, bytes)` -> `Done`, plus
 * `FailImmediately(error)` for calls that already failed while building the request.
 * Each step is computed by `advance()`, which consumes the current state and yields the
 * next one; `result()` drives it until a value or an error comes out.
 *
 * **Outcome:**
 * - 2xx: the whole body converted with `json::value_to<T>`.
 * - otherwise: the body decoded as the service error object and thrown as `ApiError`.
 * - `TransportError` / `DecodeError` propagate as they are.
 *
 * **Contract:**
 * The decoder is move-only and owned by one task. Calling `result()` again once it has
 * produced its outcome, or while another `result()` on it is suspended, throws
 * `std::logic_error`. Destroying the decoder closes the exchange it owns.
 */
template <typename T>
class ResponseDecoder {
   public:
    explicit ResponseDecoder(std::unique_ptr<PendingExchange> exchange,
                             std::size_t max_prealloc = MAX_BODY_PREALLOC)
        : state_(Connecting{std::move(exchange)}), max_prealloc_(max_prealloc) {}

    /**
     * @brief A decoder whose result() throws `error` without touching the network.
     */
    static ResponseDecoder fail(std::exception_ptr error) {
        return ResponseDecoder(FailImmediately{std::move(error)});
    }

    template <typename E>
    static ResponseDecoder fail(E error) {
        return fail(std::make_exception_ptr(std::move(error)));
    }

    ResponseDecoder(ResponseDecoder&&) noexcept = default;
    ResponseDecoder& operator=(ResponseDecoder&&) noexcept = default;
    ResponseDecoder(const ResponseDecoder&) = delete;
    ResponseDecoder& operator=(const ResponseDecoder&) = delete;

    asio::awaitable<T> result() {
        AdvanceGuard guard(advancing_, "ResponseDecoder");
        if (std::holds_alternative<Done>(state_)) {
            throw std::logic_error("ResponseDecoder polled after completion");
        }

        // While advancing, the decoder itself reads as Done; an exception leaves it so.
        State state = std::exchange(state_, Done{});
        for (;;) {
            Transition step = co_await advance(std::move(state));
            state = std::move(step.next);
            if (step.value) {
                state_ = std::move(state);
                co_return std::move(*step.value);
            }
        }
    }

    bool is_done() const noexcept { return std::holds_alternative<Done>(state_); }

   private:
    struct Connecting {
        std::unique_ptr<PendingExchange> exchange;
    };
    struct Collecting {
        ResponseHead head;
        std::unique_ptr<ByteSource> body;
        Bytes bytes;
    };
    struct FailImmediately {
        std::exception_ptr error;
    };
    struct Done {};

    using State = std::variant<Connecting, Collecting, FailImmediately, Done>;

    struct Transition {
        State next;
        std::optional<T> value;
    };

    explicit ResponseDecoder(FailImmediately failed)
        : state_(std::move(failed)), max_prealloc_(0) {}

    asio::awaitable<Transition> advance(State state) {
        if (auto* connecting = std::get_if<Connecting>(&state)) {
            Response response = co_await connecting->exchange->response();

            Collecting collecting{std::move(response.head), std::move(response.body), {}};
            collecting.bytes.reserve(body_preallocation(collecting.head, max_prealloc_));
            co_return Transition{std::move(collecting), std::nullopt};
        }

        if (auto* collecting = std::get_if<Collecting>(&state)) {
            if (auto chunk = co_await collecting->body->next_chunk()) {
                collecting->bytes.insert(collecting->bytes.end(), chunk->begin(), chunk->end());
                co_return Transition{std::move(state), std::nullopt};
            }
            if (!collecting->head.is_success()) {
                throw make_api_error(collecting->head, collecting->bytes);
            }
            co_return Transition{Done{}, decode_json<T>(as_text(collecting->bytes))};
        }

        if (auto* failed = std::get_if<FailImmediately>(&state)) {
            std::rethrow_exception(failed->error);
        }

        throw std::logic_error("ResponseDecoder advanced from the Done state");
    }

    State state_;
    std::size_t max_prealloc_;
    bool advancing_ = false;
};

/**
 * @brief Awaits the exchange and decodes its whole body into a T.
 */
template <typename T>
asio::awaitable<T> decode_once(std::unique_ptr<PendingExchange> exchange,
                               std::size_t max_prealloc = MAX_BODY_PREALLOC) {
    ResponseDecoder<T> decoder(std::move(exchange), max_prealloc);
    co_return co_await decoder.result();
}

}  // namespace b2core
