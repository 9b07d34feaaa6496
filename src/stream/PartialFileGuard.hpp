#pragma once

#include <filesystem>
#include <system_error>
#include <utility>

#include "spdlog/spdlog.h"

namespace b2core {

/**
 * @brief RAII guard. Deletes the file on destruction unless committed.
 */
class PartialFileGuard {
   public:
    explicit PartialFileGuard(std::filesystem::path path) : path_(std::move(path)) {}

    // The file is complete; keep it.
    void commit() noexcept { engaged_ = false; }

    ~PartialFileGuard() {
        if (!engaged_ || path_.empty()) return;

        std::error_code ec;
        if (!std::filesystem::remove(path_, ec) && !ec) return;
        if (ec) {
            spdlog::warn("[file] failed to remove partial file {}: {}", path_.string(),
                         ec.message());
        } else {
            spdlog::info("[file] removed partial file {}", path_.string());
        }
    }

    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;
    PartialFileGuard(PartialFileGuard&&) = delete;
    PartialFileGuard& operator=(PartialFileGuard&&) = delete;

   private:
    std::filesystem::path path_;
    bool engaged_ = true;
};

}  // namespace b2core
