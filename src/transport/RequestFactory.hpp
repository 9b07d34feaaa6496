#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include "HttpExchange.hpp"
#include "Types.hpp"

namespace b2core::RequestFactory {

// Value sent in every User-Agent header.
inline constexpr std::string_view USER_AGENT = "b2core/1.0";

/**
 * @brief Value of the Host header for a target: the host, plus the port when it is not
 * the scheme default.
 */
std::string host_header(const HttpTarget& target);

/**
 * @brief The target behind a base URL such as "http://host:8080", as returned in an
 * authorization.
 *
 * A missing scheme is read as http. A trailing "/" is accepted; any other path is not.
 * @throws std::invalid_argument for https (the transport is plain TCP), other schemes,
 * an empty host or a path.
 */
HttpTarget target_from_url(std::string_view url,
                           std::chrono::seconds connect_timeout = std::chrono::seconds{15});

/**
 * @brief "Basic <base64(key_id:application_key)>", as the account authorization call
 * expects it.
 */
std::string basic_authorization(std::string_view key_id, std::string_view application_key);

/**
 * @brief A GET request for `path` with an optional Authorization header.
 */
http::request<http::string_body> make_get_request(const HttpTarget& target,
                                                  std::string_view path,
                                                  std::string_view authorization = {});

/**
 * @brief A POST request for `path` whose body is `body` serialized as JSON.
 */
http::request<http::string_body> make_json_request(const HttpTarget& target,
                                                   std::string_view path,
                                                   std::string_view authorization,
                                                   const json::value& body);

}  // namespace b2core::RequestFactory
