#include "AuthCache.hpp"

#include <stdexcept>
#include <utility>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "Error.hpp"
#include "spdlog/spdlog.h"

namespace b2core {

AuthCache::AuthCache(asio::any_io_executor executor, Refresher refresher)
    : executor_(std::move(executor)), refresher_(std::move(refresher)) {
    if (!refresher_) {
        throw std::invalid_argument("AuthCache: refresher must not be empty");
    }
}

asio::awaitable<Authorization> AuthCache::request_authorization() {
    if (auto active = state_.load(std::memory_order_acquire)) {
        co_return *active;
    }

    auto waiter = std::make_shared<Waiter>(co_await asio::this_coro::executor, 1);
    {
        std::lock_guard lock(waiters_mutex_);
        waiters_.push_back(waiter);
    }
    start_refresh();

    auto [ec, result] = co_await waiter->async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
        throw AbortedError("authorization refresh abandoned: " + ec.message());
    }
    if (result.error) {
        std::rethrow_exception(result.error);
    }
    co_return *result.auth;
}

void AuthCache::mark_expired(const Authorization& observed) {
    auto current = state_.load(std::memory_order_acquire);
    if (current) {
        if (!(*current == observed)) {
            spdlog::debug("[auth] expiry reported for a superseded authorization, ignored");
            return;
        }
        if (!state_.compare_exchange_strong(current, nullptr, std::memory_order_acq_rel)) {
            spdlog::debug("[auth] authorization replaced while reporting expiry, ignored");
            return;
        }
        spdlog::info("[auth] authorization for account {} expired", observed.account_id);
    }
    start_refresh();
}

void AuthCache::provide(Authorization auth) {
    state_.store(std::make_shared<const Authorization>(std::move(auth)),
                 std::memory_order_release);
}

std::optional<Authorization> AuthCache::try_get_active() const {
    if (auto active = state_.load(std::memory_order_acquire)) {
        return *active;
    }
    return std::nullopt;
}

bool AuthCache::has_active() const noexcept {
    return state_.load(std::memory_order_acquire) != nullptr;
}

void AuthCache::start_refresh() {
    bool expected = false;
    if (!refreshing_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;  // joined the round in flight
    }

    auto self = shared_from_this();
    RefreshGuard guard([self] {
        spdlog::warn("[auth] refresh task destroyed before completing");
        self->finish(RefreshResult{
            nullptr, std::make_exception_ptr(
                         AbortedError("authorization refresh task destroyed before completing"))});
    });
    asio::co_spawn(executor_, run_refresh(self, std::move(guard)), asio::detached);
}

asio::awaitable<void> AuthCache::run_refresh(std::shared_ptr<AuthCache> self,
                                             RefreshGuard guard) {
    // A round may have completed between the caller's check and its election.
    if (auto active = self->state_.load(std::memory_order_acquire)) {
        guard.disarm();
        self->finish(RefreshResult{std::move(active), nullptr});
        co_return;
    }

    spdlog::info("[auth] refreshing authorization");
    RefreshResult result;
    try {
        Authorization auth = co_await self->refresher_();
        result.auth = std::make_shared<const Authorization>(std::move(auth));
    } catch (const std::exception& e) {
        spdlog::error("[auth] authorization refresh failed: {}", e.what());
        result.error = std::current_exception();
    } catch (...) {
        spdlog::error("[auth] authorization refresh failed");
        result.error = std::current_exception();
    }

    guard.disarm();
    if (result.auth) {
        spdlog::info("[auth] authorization refreshed for account {}", result.auth->account_id);
    }
    self->finish(result);
}

void AuthCache::finish(const RefreshResult& result) {
    state_.store(result.auth, std::memory_order_release);
    refreshing_.store(false, std::memory_order_release);

    std::deque<std::shared_ptr<Waiter>> waiters;
    {
        std::lock_guard lock(waiters_mutex_);
        waiters.swap(waiters_);
    }
    for (auto& waiter : waiters) {
        // Capacity 1 and a single send per channel, so this never finds it full.
        if (!waiter->try_send(boost::system::error_code{}, result)) {
            spdlog::warn("[auth] could not notify an authorization waiter");
        }
    }
    spdlog::debug("[auth] refresh round finished, {} waiter(s) notified", waiters.size());
}

}  // namespace b2core
