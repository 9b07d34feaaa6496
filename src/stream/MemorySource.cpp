#include "MemorySource.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace b2core {

namespace {

std::deque<Bytes> split(const std::uint8_t* data, std::size_t size, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("MemorySource: chunk size must be positive");
    }
    std::deque<Bytes> chunks;
    for (std::size_t offset = 0; offset < size; offset += chunk_size) {
        std::size_t len = std::min(chunk_size, size - offset);
        chunks.emplace_back(data + offset, data + offset + len);
    }
    return chunks;
}

}  // namespace

MemorySource::MemorySource(std::vector<Bytes> chunks)
    : chunks_(std::make_move_iterator(chunks.begin()), std::make_move_iterator(chunks.end())) {}

MemorySource::MemorySource(Bytes data, std::size_t chunk_size)
    : chunks_(split(data.data(), data.size(), chunk_size)) {}

MemorySource::MemorySource(std::string_view data, std::size_t chunk_size)
    : chunks_(split(reinterpret_cast<const std::uint8_t*>(data.data()), data.size(),
                    chunk_size)) {}

asio::awaitable<std::optional<Bytes>> MemorySource::next_chunk() {
    if (chunks_.empty()) {
        co_return std::nullopt;
    }
    Bytes chunk = std::move(chunks_.front());
    chunks_.pop_front();
    co_return chunk;
}

}  // namespace b2core
