#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace b2core {

// Smallest bucket a throttle accepts; below this the stream degenerates into tiny slices.
static constexpr std::size_t MIN_BUCKET_SIZE = 1024;
static constexpr std::size_t DEFAULT_BUCKET_SIZE = 8192;
// Upper bound on how much of a declared Content-Length is reserved up front.
static constexpr std::size_t MAX_BODY_PREALLOC = 0x1000000UZ;

struct EndpointConfig {
    std::string host = "api.backblazeb2.com";
    std::string port = "80";
    std::string auth_path = "/b2api/v2/b2_authorize_account";
    std::chrono::seconds connect_timeout{15};  // NOLINT
};

struct DecodeConfig {
    std::uint32_t level = 1;
    std::size_t initial_capacity = 4096;  // NOLINT
    std::size_t max_prealloc = MAX_BODY_PREALLOC;
};

struct ThrottleConfig {
    std::uint64_t rate = 0;  // bytes per second, 0 = unlimited
    std::size_t bucket_size = DEFAULT_BUCKET_SIZE;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;  // empty = console only
};

struct ClientConfig {
    EndpointConfig endpoint;
    DecodeConfig decode;
    ThrottleConfig throttle;
    LoggingConfig logging;
};

/**
 * @brief Loads configuration from a TOML file.
 * @param path Path to the .toml file (default: "b2core.toml")
 * @return Parsed ClientConfig object; defaults when the file does not exist.
 * @throws std::runtime_error if file cannot be parsed.
 * @throws std::invalid_argument if a value is out of range.
 */
ClientConfig LoadConfig(const std::string& path = "b2core.toml");

/**
 * @brief Same as LoadConfig, for a document already in memory.
 */
ClientConfig LoadConfigFromString(std::string_view document);

}  // namespace b2core
