// 1. Standard Library
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// 2. Third Party
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/this_coro.hpp>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "AccountAuthorizer.hpp"
#include "AuthCache.hpp"
#include "DownloadDecoder.hpp"
#include "Error.hpp"
#include "FileIo.hpp"
#include "HttpExchange.hpp"
#include "Logging.hpp"
#include "RequestFactory.hpp"
#include "StreamingResponseDecoder.hpp"
#include "Throttle.hpp"
#include "config.hpp"

using namespace b2core;

namespace {

void print_usage() {
    spdlog::critical("Usage: b2core_fetch auth");
    spdlog::critical("       b2core_fetch list <path> [level]");
    spdlog::critical("       b2core_fetch download <path> <output file>");
    spdlog::critical("Credentials are read from B2_KEY_ID and B2_APPLICATION_KEY,");
    spdlog::critical("configuration from $B2CORE_CONFIG (default: b2core.toml).");
}

Credentials credentials_from_env() {
    const char* key_id = std::getenv("B2_KEY_ID");
    const char* key = std::getenv("B2_APPLICATION_KEY");
    if (key_id == nullptr || key == nullptr) {
        throw std::invalid_argument("B2_KEY_ID and B2_APPLICATION_KEY must be set");
    }
    return Credentials{key_id, key};
}

// Reports a rejected credential back to the cache; the caller decides about retrying.
void report_if_expired(AuthCache& cache, const Authorization& auth, const ApiError& e) {
    if (e.should_obtain_new_authentication()) {
        spdlog::warn("Authorization rejected ({}), marking it expired", e.code());
        cache.mark_expired(auth);
    }
}

asio::awaitable<void> run_auth(std::shared_ptr<AuthCache> cache) {
    Authorization auth = co_await cache->request_authorization();
    spdlog::info("Account:          {}", auth.account_id);
    spdlog::info("API URL:          {}", auth.api_url);
    spdlog::info("Download URL:     {}", auth.download_url);
    spdlog::info("Recommended part: {} bytes", auth.recommended_part_size);
    for (const auto& capability : auth.allowed.capabilities) {
        spdlog::info("Capability:       {}", capability);
    }
}

asio::awaitable<void> run_list(std::shared_ptr<AuthCache> cache, const ClientConfig& cfg,
                               std::string path, std::uint32_t level) {
    auto ex = co_await asio::this_coro::executor;
    Authorization auth = co_await cache->request_authorization();

    auto target = RequestFactory::target_from_url(auth.api_url, cfg.endpoint.connect_timeout);
    auto request = RequestFactory::make_get_request(target, path, auth.authorization_token);
    auto elements = decode_stream<json::value>(
        std::make_unique<HttpExchange>(ex, target, std::move(request)), level,
        cfg.decode.initial_capacity, cfg.decode.max_prealloc);

    std::size_t count = 0;
    try {
        while (auto element = co_await elements.next()) {
            spdlog::info("[{}] {}", count++, json::serialize(*element));
        }
    } catch (const ApiError& e) {
        report_if_expired(*cache, auth, e);
        throw;
    }
    spdlog::info("{} element(s)", count);
}

asio::awaitable<void> run_download(std::shared_ptr<AuthCache> cache, const ClientConfig& cfg,
                                   std::string path, std::string output) {
    auto ex = co_await asio::this_coro::executor;
    Authorization auth = co_await cache->request_authorization();

    auto target =
        RequestFactory::target_from_url(auth.download_url, cfg.endpoint.connect_timeout);
    auto request = RequestFactory::make_get_request(target, path, auth.authorization_token);

    Download download;
    try {
        download = co_await start_download(
            std::make_unique<HttpExchange>(ex, target, std::move(request)),
            cfg.decode.max_prealloc);
    } catch (const ApiError& e) {
        report_if_expired(*cache, auth, e);
        throw;
    }

    Throttle throttle(cfg.throttle);
    auto body = throttle.wrap(std::move(download.body));
    std::size_t written = co_await pipe_to_file(*body, output);
    spdlog::info("Downloaded {} bytes to {}", written, output);
}

bool valid_command(const std::vector<std::string>& args) {
    if (args.empty()) return false;
    const auto& command = args[0];
    return (command == "auth" && args.size() == 1) ||
           (command == "list" && (args.size() == 2 || args.size() == 3)) ||
           (command == "download" && args.size() == 3);
}

asio::awaitable<void> run_command(std::shared_ptr<AuthCache> cache, ClientConfig cfg,
                                  std::vector<std::string> args) {
    if (args[0] == "auth") {
        co_await run_auth(cache);
    } else if (args[0] == "list") {
        auto level =
            args.size() == 3 ? static_cast<std::uint32_t>(std::stoul(args[2])) : cfg.decode.level;
        co_await run_list(cache, cfg, args[1], level);
    } else {
        co_await run_download(cache, cfg, args[1], args[2]);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        const char* config_path = std::getenv("B2CORE_CONFIG");
        ClientConfig cfg = LoadConfig(config_path != nullptr ? config_path : "b2core.toml");
        setup_logging(cfg.logging);

        std::vector<std::string> args(argv + 1, argv + argc);
        if (!valid_command(args)) {
            print_usage();
            return EXIT_FAILURE;
        }

        asio::io_context ioc;
        AccountAuthorizer authorizer(ioc.get_executor(), cfg.endpoint, credentials_from_env());
        auto cache = std::make_shared<AuthCache>(ioc.get_executor(), authorizer);

        // Graceful Shutdown Signal
        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc](const boost::system::error_code& ec, int signal_number) {
            if (ec) return;
            spdlog::info("Stop signal ({}) received. Shutting down...", signal_number);
            ioc.stop();
        });

        std::exception_ptr failure;
        asio::co_spawn(ioc, run_command(cache, cfg, std::move(args)),
                       [&](std::exception_ptr e) {
                           failure = e;
                           signals.cancel();
                       });
        ioc.run();

        if (failure) {
            std::rethrow_exception(failure);
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
