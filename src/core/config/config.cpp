#include "config.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <toml++/toml.hpp>

namespace b2core {

namespace {

ClientConfig FromTable(const toml::table& tbl) {
    ClientConfig config;

    // 1. Endpoint
    if (auto endpoint = tbl["endpoint"]) {
        config.endpoint.host = endpoint["host"].value_or(config.endpoint.host);
        config.endpoint.port = endpoint["port"].value_or(config.endpoint.port);
        config.endpoint.auth_path = endpoint["auth_path"].value_or(config.endpoint.auth_path);
        config.endpoint.connect_timeout = std::chrono::seconds(
            endpoint["connect_timeout_seconds"].value_or<int64_t>(
                config.endpoint.connect_timeout.count()));
    }

    // 2. Decoding
    if (auto decode = tbl["decode"]) {
        config.decode.level = decode["level"].value_or(config.decode.level);
        config.decode.initial_capacity =
            decode["initial_capacity"].value_or(config.decode.initial_capacity);
        config.decode.max_prealloc =
            decode["max_prealloc"].value_or(config.decode.max_prealloc);
    }

    // 3. Throttling
    if (auto throttle = tbl["throttle"]) {
        config.throttle.rate = throttle["rate"].value_or(config.throttle.rate);
        config.throttle.bucket_size =
            throttle["bucket_size"].value_or(config.throttle.bucket_size);
    }

    // 4. Logging
    if (auto logging = tbl["logging"]) {
        config.logging.level = logging["level"].value_or(config.logging.level);
        config.logging.file = logging["file"].value_or(config.logging.file);
    }

    if (config.decode.level == 0) {
        throw std::invalid_argument("decode.level must be at least 1");
    }
    if (config.throttle.bucket_size < MIN_BUCKET_SIZE) {
        throw std::invalid_argument("throttle.bucket_size must be at least " +
                                    std::to_string(MIN_BUCKET_SIZE));
    }
    return config;
}

}  // namespace

ClientConfig LoadConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        return ClientConfig{};
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw std::runtime_error("Config parse error");
    }

    auto config = FromTable(tbl);
    spdlog::info("Loaded configuration from {}", path);
    return config;
}

ClientConfig LoadConfigFromString(std::string_view document) {
    toml::table tbl;
    try {
        tbl = toml::parse(document);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config: {}", err.description());
        throw std::runtime_error("Config parse error");
    }
    return FromTable(tbl);
}

}  // namespace b2core
