/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for waiting operations.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <utility>

namespace pubsubd {
namespace core {

/**
 * @class CancellationToken
 * @brief Set-once flag with a single wake-up hook.
 *
 * A waiter installs a hook that nudges whatever it is blocked on; cancel()
 * raises the flag and then runs the hook. A hook installed after
 * cancellation runs immediately.
 *
 * Usage:
 * @code
 * CancellationToken token;
 * std::thread waiter([&] { dispatcher.pull(name, 10, false, out, &token); });
 * token.cancel();   // waiter returns CANCELLED unless it already got messages
 * @endcode
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        // The hook runs under mutex_ so clearHook() cannot return while it is
        // still touching the waiter's state.
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true)) {
            return;
        }
        if (hook_) {
            hook_();
        }
    }

    bool isCancelled() const {
        return cancelled_.load();
    }

    /**
     * @brief Install the wake-up hook. Must not be called with any lock held
     * that the hook itself takes.
     */
    void setHook(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
        if (cancelled_.load() && hook_) {
            hook_();
        }
    }

    void clearHook() {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = nullptr;
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::function<void()> hook_;
};

}  // namespace core
}  // namespace pubsubd
