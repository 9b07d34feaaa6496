#pragma once

#include <atomic>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include "Authorization.hpp"
#include "RefreshGuard.hpp"
#include "Types.hpp"

namespace b2core {

/**
 * @brief Serves one shared Authorization to any number of concurrent callers, with at
 * most one refresh in flight at a time.
 *
 * @details
 * **State:**
 * The active credential is an atomic `shared_ptr` (null = none) that is only ever
 * replaced as a whole. A refresh round is owned by the caller that flips `refreshing_`
 * from false to true; that leader runs the refresher as a task on the cache's executor.
 *
 * **Waiting:**
 * Callers that find no active credential enqueue a one-shot channel and suspend on it.
 * When the round ends, whatever the outcome, the leader task
 * (a) stores the new state (success = active, failure = none),
 * (b) releases the leader flag,
 * (c) drains the queue, handing every waiter the same result.
 * If the task is destroyed before it finishes (executor shut down), its RefreshGuard
 * does the same with an AbortedError.
 *
 * Thread-safe. Must be owned by a `std::shared_ptr`.
 */
class AuthCache : public std::enable_shared_from_this<AuthCache> {
   public:
    using Refresher = std::function<asio::awaitable<Authorization>()>;

    /**
     * @param executor Where refresh tasks run.
     * @param refresher Obtains a fresh Authorization, e.g. an AccountAuthorizer.
     */
    AuthCache(asio::any_io_executor executor, Refresher refresher);

    AuthCache(const AuthCache&) = delete;
    AuthCache& operator=(const AuthCache&) = delete;

    /**
     * @brief The active credential, or the outcome of the refresh it waits for.
     * @throws whatever the refresher threw, or AbortedError if the refresh was abandoned.
     */
    asio::awaitable<Authorization> request_authorization();

    /**
     * @brief Reports that `observed` was rejected by the service.
     *
     * Drops the active credential only if it still equals `observed` and starts a
     * refresh in the background. A newer credential is left alone. Never waits.
     */
    void mark_expired(const Authorization& observed);

    /**
     * @brief Installs a credential obtained elsewhere. A refresh finishing later wins.
     */
    void provide(Authorization auth);

    std::optional<Authorization> try_get_active() const;
    bool has_active() const noexcept;

   private:
    struct RefreshResult {
        std::shared_ptr<const Authorization> auth;  // null on failure
        std::exception_ptr error;
    };

    using Waiter = asio::experimental::concurrent_channel<void(boost::system::error_code,
                                                               RefreshResult)>;

    // Becomes the leader and spawns the refresh task, unless a round is in flight.
    void start_refresh();

    // Ends a refresh round; see the class comment for the order of the steps.
    void finish(const RefreshResult& result);

    static asio::awaitable<void> run_refresh(std::shared_ptr<AuthCache> self,
                                             RefreshGuard guard);

    asio::any_io_executor executor_;
    Refresher refresher_;

    std::atomic<std::shared_ptr<const Authorization>> state_;
    std::atomic<bool> refreshing_{false};

    std::mutex waiters_mutex_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
};

}  // namespace b2core
