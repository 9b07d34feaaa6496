#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/error.hpp>

#include "DownloadDecoder.hpp"
#include "Error.hpp"
#include "ScriptedExchange.hpp"
#include "StreamUtil.hpp"
#include "TestHarness.hpp"

namespace b2core {

using test::run_coro;
using test::scripted;
using test::ScriptedExchange;
using test::ScriptedSource;
using test::to_string;

TEST(DownloadDecoder, HeadArrivesBeforeBody) {
    auto tally = std::make_shared<ScriptedSource::Tally>();
    http::fields headers;
    headers.set(http::field::content_length, "11");
    headers.set("X-Bz-File-Name", "hello.txt");
    auto exchange = std::make_unique<ScriptedExchange>(
        200,
        std::make_unique<ScriptedSource>(std::vector<std::string>{"hello", " world"},
                                         std::nullopt, tally),
        headers);

    asio::io_context ioc;
    auto download = run_coro(ioc, start_download(std::move(exchange)));
    EXPECT_EQ(download.head.status, 200U);
    EXPECT_EQ(content_length(download.head), 11U);
    EXPECT_EQ(std::string(download.head.headers["X-Bz-File-Name"]), "hello.txt");
    EXPECT_EQ(tally->pulls, 0U);

    EXPECT_EQ(to_string(run_coro(ioc, collect(*download.body))), "hello world");
}

TEST(DownloadDecoder, ErrorStatusBecomesApiError) {
    auto exchange = scripted(404, {R"({"status": 404, "code": "not_found", )",
                                   R"("message": "File with such name does not exist"})"});
    try {
        run_coro(start_download(std::move(exchange)));
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.http_status(), 404U);
        EXPECT_EQ(e.code(), "not_found");
        EXPECT_FALSE(e.should_obtain_new_authentication());
    }
}

TEST(DownloadDecoder, ConnectFailureIsTransportError) {
    EXPECT_THROW(run_coro(start_download(ScriptedExchange::failing(asio::error::timed_out))),
                 TransportError);
}

TEST(DownloadDecoder, BodyFailureSurfacesWhileReading) {
    auto exchange = std::make_unique<ScriptedExchange>(
        200, std::make_unique<ScriptedSource>(std::vector<std::string>{"part"},
                                              asio::error::connection_reset));
    asio::io_context ioc;
    auto download = run_coro(ioc, start_download(std::move(exchange)));
    EXPECT_THROW(run_coro(ioc, collect(*download.body)), TransportError);
}

TEST(DownloadDecoder, ErrorBodyHonoursPreallocCap) {
    http::fields headers;
    headers.set(http::field::content_length,
                std::to_string(std::numeric_limits<std::size_t>::max()));
    const std::vector<std::string> body{
        R"({"status": 404, "code": "not_found", "message": "no such file"})"};

    EXPECT_THROW(run_coro(start_download(scripted(404, body, headers), 64)), ApiError);
    EXPECT_THROW(run_coro(start_download(scripted(404, body, headers),
                                         std::numeric_limits<std::size_t>::max())),
                 std::length_error);
}

}  // namespace b2core
