#include "AccountAuthorizer.hpp"

#include <memory>
#include <utility>

#include "RequestFactory.hpp"
#include "ResponseDecoder.hpp"
#include "spdlog/spdlog.h"

namespace b2core {

AccountAuthorizer::AccountAuthorizer(asio::any_io_executor ex, EndpointConfig endpoint,
                                     Credentials credentials)
    : ex_(std::move(ex)), endpoint_(std::move(endpoint)), credentials_(std::move(credentials)) {}

asio::awaitable<Authorization> AccountAuthorizer::operator()() const {
    HttpTarget target{endpoint_.host, endpoint_.port, endpoint_.connect_timeout};
    auto request = RequestFactory::make_get_request(target, endpoint_.auth_path,
                                                    credentials_.basic_auth_header());

    spdlog::debug("[auth] authorizing key {} against {}", credentials_.key_id, endpoint_.host);
    auto exchange = std::make_unique<HttpExchange>(ex_, std::move(target), std::move(request));
    co_return co_await decode_once<Authorization>(std::move(exchange));
}

}  // namespace b2core
