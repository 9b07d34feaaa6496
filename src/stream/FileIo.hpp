#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/stream_file.hpp>

#include "Exchange.hpp"
#include "Types.hpp"

namespace b2core {

// Chunk size used when reading files.
static constexpr std::size_t FILE_CHUNK_SIZE = 64 * KILOBYTE;

/**
 * @brief A ByteSource reading a file through `asio::stream_file`.
 */
class FileSource : public ByteSource {
   public:
    /**
     * @throws boost::system::system_error if the file cannot be opened.
     */
    FileSource(asio::any_io_executor ex, const std::filesystem::path& path,
               std::size_t chunk_size = FILE_CHUNK_SIZE);

    asio::awaitable<std::optional<Bytes>> next_chunk() override;

    // Size of the file when it was opened.
    std::size_t size() const noexcept { return size_; }

   private:
    asio::stream_file file_;
    std::size_t chunk_size_;
    std::size_t size_ = 0;
    bool eof_ = false;
};

/**
 * @brief Writes everything `source` yields to `path` (created or truncated).
 *
 * If the source or a write fails, the partial file is removed and the error
 * propagates.
 *
 * @return Number of bytes written.
 */
asio::awaitable<std::size_t> pipe_to_file(ByteSource& source, const std::filesystem::path& path);

}  // namespace b2core
