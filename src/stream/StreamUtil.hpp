#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>

#include "Exchange.hpp"
#include "Types.hpp"

// Forward declaration so the header does not pull in OpenSSL.
struct evp_md_ctx_st;

namespace b2core {

// Upload "sha1" value announcing that the checksum follows the content.
inline constexpr std::string_view HEX_DIGITS_AT_END = "hex_digits_at_end";

/**
 * @brief Content length of an upload whose SHA-1 (40 hex digits) is appended.
 */
constexpr std::size_t len_with_sha1(std::size_t len) noexcept { return len + 40; }

/**
 * @brief Reads a source to the end into one buffer.
 * @param size_hint Bytes reserved up front.
 */
asio::awaitable<Bytes> collect(ByteSource& source, std::size_t size_hint = 0);

/**
 * @brief Lowercase hex SHA-1 of `data`.
 */
std::string sha1_hex(std::span<const std::uint8_t> data);

/**
 * @brief Passes the chunks of a source through and appends the lowercase hex SHA-1 of
 * everything it passed as one last chunk.
 */
class Sha1AtEnd : public ByteSource {
   public:
    explicit Sha1AtEnd(std::unique_ptr<ByteSource> inner);
    ~Sha1AtEnd() override;

    Sha1AtEnd(const Sha1AtEnd&) = delete;
    Sha1AtEnd& operator=(const Sha1AtEnd&) = delete;

    asio::awaitable<std::optional<Bytes>> next_chunk() override;

   private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<ByteSource> inner_;
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool done_ = false;
};

}  // namespace b2core
