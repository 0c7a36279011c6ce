/**
 * @file subscription.hpp
 * @brief Delivery state of one subscription: backlog, leases, waiters.
 *
 * Every mutation of the backlog and the lease table (fan-out, drain+lease,
 * ack, expiry, deadline change, deletion) happens under the subscription's
 * single mutex, so a message is at any instant either in the backlog or in
 * exactly one lease. Waiting pulls block on a condition variable tied to
 * that mutex and therefore never hold it while suspended.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/core/export.hpp"
#include "pubsubd/core/backlog.hpp"
#include "pubsubd/core/cancellation.hpp"
#include "pubsubd/core/lease_table.hpp"
#include "pubsubd/core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace pubsubd {
namespace core {

/**
 * @brief Counters for one subscription.
 */
struct SubscriptionStats {
    BacklogStats backlog;
    size_t outstanding_leases = 0;
    uint64_t total_leased = 0;
    uint64_t total_acked = 0;
    uint64_t total_expired = 0;
    uint32_t active_pulls = 0;
};

/**
 * @class Subscription
 * @brief Backlog + lease table + wait/notify signal of one subscription.
 *
 * Thread-safe. Shared between the registry, the dispatchers and the
 * sweeper through std::shared_ptr; deletion closes it in place so holders
 * of a stale pointer observe an empty, inert subscription.
 */
class PUBSUBD_CORE_API Subscription {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    enum class WaitResult {
        READY,      ///< Backlog has at least one entry
        CANCELLED,  ///< Token was cancelled
        TIMED_OUT,  ///< Deadline passed with nothing to deliver
        CLOSED      ///< Subscription was deleted
    };

    Subscription(std::string name,
                 std::string topic,
                 int32_t ackDeadlineSeconds,
                 PushConfig pushConfig);

    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    const std::string& name() const { return name_; }
    int32_t ackDeadlineSeconds() const { return ackDeadlineSeconds_; }

    /**
     * @brief Topic name, or kDeletedTopic once the topic is gone.
     */
    std::string topic() const;
    void markTopicDeleted();

    PushConfig pushConfig() const;
    void setPushConfig(PushConfig config);
    bool isPush() const;

    SubscriptionInfo info() const;

    // =========================================================================
    // Delivery
    // =========================================================================

    /**
     * @brief Append a newly published message and wake waiters.
     * @return False if the subscription is closed (message dropped).
     */
    bool enqueue(MessagePtr message);

    /**
     * @brief Drain up to @p maxMessages entries and lease each one.
     *
     * Each lease expires at @p now plus the subscription's ack deadline and
     * carries a fresh ack id. The entry's attempt counter is incremented;
     * the reported delivery_attempt is its value before this lease.
     */
    std::vector<ReceivedMessage> leaseBatch(size_t maxMessages, TimePoint now);

    /**
     * @brief Drop the leases named by @p ackIds. Unknown ids are ignored.
     * @return Number of leases removed.
     */
    size_t acknowledge(const std::vector<std::string>& ackIds);

    /**
     * @brief Set the expiry of the named leases to @p now + @p offset.
     * @return Number of leases updated.
     */
    size_t modifyAckDeadline(const std::vector<std::string>& ackIds,
                             std::chrono::seconds offset,
                             TimePoint now);

    /**
     * @brief Move leases expired at @p now back to the backlog tail.
     * @return Number of entries requeued.
     */
    size_t requeueExpired(TimePoint now);

    /**
     * @brief Block until the backlog is non-empty, @p token is cancelled,
     * the subscription is closed, or @p deadline passes.
     *
     * Once @p deadline has passed the result is TIMED_OUT even if the
     * backlog is non-empty.
     */
    WaitResult waitForMessages(TimePoint deadline, CancellationToken* token);

    // =========================================================================
    // Pull admission
    // =========================================================================

    /**
     * @brief Take one of @p cap concurrent pull slots.
     * @return False if all slots are taken.
     */
    bool tryAcquirePullSlot(uint32_t cap);
    void releasePullSlot();
    uint32_t activePulls() const { return activePulls_.load(); }

    // =========================================================================
    // Lifecycle and inspection
    // =========================================================================

    /**
     * @brief Discard backlog and leases atomically and wake every waiter.
     */
    void close();
    bool isClosed() const;

    size_t backlogSize() const;
    size_t leaseCount() const;

    /**
     * @brief Message ids currently in the backlog, front to back.
     */
    std::vector<std::string> backlogMessageIds() const;

    /**
     * @brief Message ids currently leased, unordered.
     */
    std::vector<std::string> leasedMessageIds() const;

    SubscriptionStats stats() const;

private:
    const std::string name_;
    const int32_t ackDeadlineSeconds_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string topic_;
    PushConfig pushConfig_;
    Backlog backlog_;
    LeaseTable leases_;
    bool closed_ = false;

    uint64_t totalLeased_ = 0;
    uint64_t totalAcked_ = 0;
    uint64_t totalExpired_ = 0;

    std::atomic<uint32_t> activePulls_{0};
};

}  // namespace core
}  // namespace pubsubd
