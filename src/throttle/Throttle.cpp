#include "Throttle.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace b2core {

namespace {

void check_bucket_size(std::size_t bucket_size) {
    if (bucket_size < MIN_BUCKET_SIZE) {
        throw std::invalid_argument("Throttle: bucket size must be at least " +
                                    std::to_string(MIN_BUCKET_SIZE));
    }
}

}  // namespace

Throttle::Throttle(std::uint64_t rate, std::size_t bucket_size)
    : active_streams_(std::make_shared<std::atomic<std::size_t>>(0)),
      rate_(rate),
      bucket_size_(bucket_size) {
    check_bucket_size(bucket_size);
}

std::unique_ptr<ThrottledSource> Throttle::wrap(std::unique_ptr<ByteSource> source) const {
    return std::make_unique<ThrottledSource>(std::move(source), rate_, bucket_size_,
                                             active_streams_);
}

void Throttle::set_default_bucket_size(std::size_t bucket_size) {
    check_bucket_size(bucket_size);
    bucket_size_ = bucket_size;
}

}  // namespace b2core
