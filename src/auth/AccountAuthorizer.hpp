#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "Authorization.hpp"
#include "HttpExchange.hpp"
#include "Types.hpp"
#include "config.hpp"

namespace b2core {

/**
 * @brief Performs the account authorization call. Usable as an AuthCache refresher.
 */
class AccountAuthorizer {
   public:
    AccountAuthorizer(asio::any_io_executor ex, EndpointConfig endpoint,
                      Credentials credentials);

    /**
     * @throws ApiError (e.g. bad_auth_token for wrong credentials), TransportError,
     * DecodeError.
     */
    asio::awaitable<Authorization> operator()() const;

    const Credentials& credentials() const noexcept { return credentials_; }

   private:
    asio::any_io_executor ex_;
    EndpointConfig endpoint_;
    Credentials credentials_;
};

}  // namespace b2core
