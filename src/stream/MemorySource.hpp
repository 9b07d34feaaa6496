#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "Exchange.hpp"
#include "Types.hpp"

namespace b2core {

/**
 * @brief A ByteSource over bytes already in memory.
 */
class MemorySource : public ByteSource {
   public:
    // Yields `chunks` as they are, in order.
    explicit MemorySource(std::vector<Bytes> chunks);

    // Yields `data` in chunks of at most `chunk_size` bytes.
    MemorySource(Bytes data, std::size_t chunk_size);
    MemorySource(std::string_view data, std::size_t chunk_size);

    asio::awaitable<std::optional<Bytes>> next_chunk() override;

    std::size_t remaining_chunks() const noexcept { return chunks_.size(); }

   private:
    std::deque<Bytes> chunks_;
};

}  // namespace b2core
