#include "StreamUtil.hpp"

#include <openssl/evp.h>

#include <array>
#include <utility>

#include "Error.hpp"

namespace b2core {

namespace {

constexpr std::string_view HEX = "0123456789abcdef";

void check(int rc, const char* what) {
    if (rc != 1) {
        throw Error(std::string("SHA-1: ") + what + " failed");
    }
}

std::string to_hex(const unsigned char* digest, unsigned int len) {
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(HEX[digest[i] >> 4]);
        out.push_back(HEX[digest[i] & 0x0f]);
    }
    return out;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    check(EVP_DigestFinal_ex(ctx, digest.data(), &len), "EVP_DigestFinal_ex");
    return to_hex(digest.data(), len);
}

}  // namespace

asio::awaitable<Bytes> collect(ByteSource& source, std::size_t size_hint) {
    Bytes out;
    out.reserve(size_hint);
    while (auto chunk = co_await source.next_chunk()) {
        out.insert(out.end(), chunk->begin(), chunk->end());
    }
    co_return out;
}

std::string sha1_hex(std::span<const std::uint8_t> data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
    if (!ctx) {
        throw Error("SHA-1: EVP_MD_CTX_new failed");
    }
    check(EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr), "EVP_DigestInit_ex");
    check(EVP_DigestUpdate(ctx.get(), data.data(), data.size()), "EVP_DigestUpdate");
    return finish_hex(ctx.get());
}

// ============================================================================
// Sha1AtEnd
// ============================================================================

void Sha1AtEnd::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha1AtEnd::Sha1AtEnd(std::unique_ptr<ByteSource> inner)
    : inner_(std::move(inner)), ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw Error("SHA-1: EVP_MD_CTX_new failed");
    }
    check(EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr), "EVP_DigestInit_ex");
}

Sha1AtEnd::~Sha1AtEnd() = default;

asio::awaitable<std::optional<Bytes>> Sha1AtEnd::next_chunk() {
    if (done_) {
        co_return std::nullopt;
    }

    auto chunk = co_await inner_->next_chunk();
    if (chunk) {
        check(EVP_DigestUpdate(ctx_.get(), chunk->data(), chunk->size()), "EVP_DigestUpdate");
        co_return chunk;
    }

    done_ = true;
    std::string hex = finish_hex(ctx_.get());
    co_return Bytes(hex.begin(), hex.end());
}

}  // namespace b2core
