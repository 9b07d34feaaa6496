#include "FileIo.hpp"

#include <stdexcept>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include "Error.hpp"
#include "PartialFileGuard.hpp"
#include "spdlog/spdlog.h"

namespace b2core {

// Log progress every N Megabytes
static constexpr size_t PROGRESS_LOG_MB = 5;

// ============================================================================
// FileSource
// ============================================================================

FileSource::FileSource(asio::any_io_executor ex, const std::filesystem::path& path,
                       std::size_t chunk_size)
    : file_(ex), chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("FileSource: chunk size must be positive");
    }

    boost::system::error_code ec;
    file_.open(path.string(), asio::stream_file::read_only, ec);
    if (ec) {
        throw boost::system::system_error(ec, "Failed to open local file: " + path.string());
    }
    size_ = static_cast<std::size_t>(file_.size());
}

asio::awaitable<std::optional<Bytes>> FileSource::next_chunk() {
    if (eof_) {
        co_return std::nullopt;
    }

    Bytes chunk(chunk_size_);
    auto [ec, bytes_read] = co_await file_.async_read_some(asio::buffer(chunk),
                                                           asio::as_tuple(asio::use_awaitable));
    if (ec == asio::error::eof || (!ec && bytes_read == 0)) {
        eof_ = true;
        boost::system::error_code close_ec;
        file_.close(close_ec);
        if (close_ec) {
            spdlog::warn("[file] closing source file failed: {}", close_ec.message());
        }
        co_return std::nullopt;
    }
    if (ec) {
        throw TransportError("reading local file", ec);
    }

    chunk.resize(bytes_read);
    co_return chunk;
}

// ============================================================================
// pipe_to_file
// ============================================================================

asio::awaitable<std::size_t> pipe_to_file(ByteSource& source, const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code dir_ec;
        std::filesystem::create_directories(path.parent_path(), dir_ec);
        if (dir_ec) {
            throw boost::system::system_error(dir_ec, "Failed to create directory: " +
                                                          path.parent_path().string());
        }
    }

    asio::stream_file file(co_await asio::this_coro::executor);
    boost::system::error_code ec;
    file.open(path.string(),
              asio::stream_file::write_only | asio::stream_file::create |
                  asio::stream_file::truncate,
              ec);
    if (ec) {
        throw boost::system::system_error(ec, "Failed to open local file: " + path.string());
    }

    // If anything below throws, the guard deletes the partial file.
    PartialFileGuard guard(path);

    std::size_t total_written = 0;
    std::size_t last_logged_mb = 0;
    while (auto chunk = co_await source.next_chunk()) {
        total_written +=
            co_await asio::async_write(file, asio::buffer(*chunk), asio::use_awaitable);

        std::size_t current_mb = total_written / MEGABYTE;
        if (current_mb >= last_logged_mb + PROGRESS_LOG_MB) {
            spdlog::info("[file] ... {} MB written to {}", current_mb, path.string());
            last_logged_mb = current_mb;
        }
    }

    file.close();
    guard.commit();
    spdlog::debug("[file] wrote {} bytes to {}", total_written, path.string());
    co_return total_written;
}

}  // namespace b2core
