/**
 * @file expiry_sweeper.cpp
 * @brief ExpirySweeper implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/core/expiry_sweeper.hpp"
#include "pubsubd/utils/logger.hpp"

#include <algorithm>

namespace pubsubd {
namespace core {

ExpirySweeper::ExpirySweeper(std::shared_ptr<Registry> registry,
                             std::chrono::milliseconds interval)
    : registry_(std::move(registry))
    , interval_(std::max(interval, std::chrono::milliseconds(1)))
{}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

bool ExpirySweeper::start() {
    if (running_.exchange(true)) {
        LOG_WARN("ExpirySweeper", "Sweeper already running");
        return false;
    }

    thread_ = std::thread(&ExpirySweeper::sweepLoop, this);
    LOG_INFO("ExpirySweeper", "Sweeper started (interval={}ms)", interval_.count());
    return true;
}

void ExpirySweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }
    waitCv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("ExpirySweeper", "Sweeper stopped ({} lease(s) requeued)", totalRequeued_.load());
}

size_t ExpirySweeper::sweepOnce(Subscription::TimePoint now) {
    size_t requeued = 0;
    for (const auto& subscription : registry_->allSubscriptions()) {
        requeued += subscription->requeueExpired(now);
    }

    if (requeued > 0) {
        totalRequeued_ += requeued;
        LOG_DEBUG("ExpirySweeper", "Requeued {} expired lease(s)", requeued);
    }
    return requeued;
}

void ExpirySweeper::sweepLoop() {
    LOG_DEBUG("ExpirySweeper", "Sweep thread started");

    while (running_.load()) {
        sweepOnce();

        std::unique_lock<std::mutex> lock(waitMutex_);
        waitCv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
    }

    LOG_DEBUG("ExpirySweeper", "Sweep thread stopped");
}

}  // namespace core
}  // namespace pubsubd
