#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

namespace b2core {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
using tcp = asio::ip::tcp;

// One chunk of a body, as produced by a ByteSource.
using Bytes = std::vector<std::uint8_t>;

static constexpr std::size_t KILOBYTE = 1024;
static constexpr std::size_t MEGABYTE = 1024 * KILOBYTE;

}  // namespace b2core
