#pragma once

#include <functional>
#include <utility>

namespace b2core {

/**
 * @brief RAII guard. Runs `on_abandoned` on destruction unless disarmed.
 *
 * Moved into the refresh coroutine as a parameter, so it fires even when the coroutine
 * frame is destroyed before its body ever ran.
 */
class RefreshGuard {
   public:
    explicit RefreshGuard(std::function<void()> on_abandoned)
        : on_abandoned_(std::move(on_abandoned)) {}

    RefreshGuard(RefreshGuard&& other) noexcept
        : on_abandoned_(std::exchange(other.on_abandoned_, nullptr)) {}

    // Disarm the guard once the refresh has been finished normally
    void disarm() { on_abandoned_ = nullptr; }

    ~RefreshGuard() {
        if (on_abandoned_) {
            on_abandoned_();
        }
    }

    RefreshGuard(const RefreshGuard&) = delete;
    RefreshGuard& operator=(const RefreshGuard&) = delete;
    RefreshGuard& operator=(RefreshGuard&&) = delete;

   private:
    std::function<void()> on_abandoned_;
};

}  // namespace b2core
