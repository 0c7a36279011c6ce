/**
 * @file push_dispatcher.hpp
 * @brief Delivery loops for subscriptions with a push endpoint.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/core/export.hpp"
#include "pubsubd/core/cancellation.hpp"
#include "pubsubd/core/push_transport.hpp"
#include "pubsubd/core/subscription.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace pubsubd {
namespace core {

/**
 * @brief Push loop tuning.
 */
struct PushOptions {
    uint32_t batch_size = 10;      ///< Entries leased per loop iteration
    int64_t idle_wait_ms = 1000;   ///< Wait when the backlog is empty
};

/**
 * @class PushDispatcher
 * @brief Runs one delivery loop per push subscription.
 *
 * Each loop leases entries exactly like a pull would and hands them to
 * the transport one at a time, renewing each lease to a full ack deadline
 * just before its attempt. A successful delivery acknowledges the lease;
 * a failed one is left to expire so the sweeper redelivers it.
 * A loop ends when its subscription is closed, loses its push endpoint,
 * or the dispatcher stops. Watching the same subscription again after
 * its loop ended starts a fresh loop.
 */
class PUBSUBD_CORE_API PushDispatcher {
public:
    PushDispatcher(std::shared_ptr<PushTransport> transport, PushOptions options = {});
    ~PushDispatcher();

    PushDispatcher(const PushDispatcher&) = delete;
    PushDispatcher& operator=(const PushDispatcher&) = delete;

    /**
     * @brief Ensure a loop is running if @p subscription has a push endpoint.
     */
    void watch(const std::shared_ptr<Subscription>& subscription);

    /**
     * @brief Join loops that have already exited and forget them.
     */
    void reapFinished();

    /**
     * @brief Stop and join every loop. Further watch() calls are ignored.
     */
    void stop();

    /**
     * @brief Number of loops that have not yet exited.
     */
    size_t activeLoops() const;

    uint64_t totalDelivered() const { return totalDelivered_.load(); }
    uint64_t totalFailed() const { return totalFailed_.load(); }

private:
    struct Loop {
        std::shared_ptr<Subscription> subscription;  ///< Released once finished
        CancellationToken stopToken;
        std::thread thread;
        bool finished = false;  ///< Guarded by PushDispatcher::mutex_
    };

    void run(Loop* loop);

    /**
     * @brief Decide under mutex_ whether @p loop keeps going; marks it
     * finished otherwise so a later watch() can replace it.
     */
    bool shouldContinue(Loop* loop);

    /**
     * @brief Move finished loops out of loops_. Caller holds mutex_.
     */
    void takeFinished(std::vector<std::unique_ptr<Loop>>& reaped);

    std::shared_ptr<PushTransport> transport_;
    PushOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<const Subscription*, std::unique_ptr<Loop>> loops_;
    bool stopped_ = false;

    std::atomic<uint64_t> totalDelivered_{0};
    std::atomic<uint64_t> totalFailed_{0};
};

}  // namespace core
}  // namespace pubsubd
