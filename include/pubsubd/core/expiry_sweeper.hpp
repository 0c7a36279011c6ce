/**
 * @file expiry_sweeper.hpp
 * @brief Background task returning expired leases to their backlogs.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/core/export.hpp"
#include "pubsubd/core/registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace pubsubd {
namespace core {

/**
 * @class ExpirySweeper
 * @brief Periodically requeues every lease whose expiry has passed.
 *
 * A lease expired at time T is moved back to the backlog tail no later
 * than T plus one sweep interval. Requeued entries keep their attempt
 * counter and wake waiting pulls.
 */
class PUBSUBD_CORE_API ExpirySweeper {
public:
    ExpirySweeper(std::shared_ptr<Registry> registry, std::chrono::milliseconds interval);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    /**
     * @brief Start the sweep thread.
     * @return false if already running.
     */
    bool start();

    /**
     * @brief Stop and join the sweep thread.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Run one pass over all subscriptions.
     * @return Number of leases requeued.
     */
    size_t sweepOnce(Subscription::TimePoint now);
    size_t sweepOnce() { return sweepOnce(Subscription::Clock::now()); }

    uint64_t totalRequeued() const { return totalRequeued_.load(); }

private:
    void sweepLoop();

    std::shared_ptr<Registry> registry_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> totalRequeued_{0};
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    std::thread thread_;
};

}  // namespace core
}  // namespace pubsubd
