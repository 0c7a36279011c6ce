/**
 * @file subscription.cpp
 * @brief Subscription implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/core/subscription.hpp"
#include "pubsubd/utils/logger.hpp"

#include <utility>

namespace pubsubd {
namespace core {

Subscription::Subscription(std::string name,
                           std::string topic,
                           int32_t ackDeadlineSeconds,
                           PushConfig pushConfig)
    : name_(std::move(name))
    , ackDeadlineSeconds_(ackDeadlineSeconds)
    , topic_(std::move(topic))
    , pushConfig_(std::move(pushConfig))
{
    LOG_DEBUG("Subscription", "Created {} on {} (ack_deadline={}s, push={})",
              name_, topic_, ackDeadlineSeconds_,
              pushConfig_.empty() ? std::string("none") : pushConfig_.push_endpoint);
}

Subscription::~Subscription() {
    close();
}

std::string Subscription::topic() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return topic_;
}

void Subscription::markTopicDeleted() {
    std::lock_guard<std::mutex> lock(mutex_);
    topic_ = kDeletedTopic;
}

PushConfig Subscription::pushConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushConfig_;
}

void Subscription::setPushConfig(PushConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    pushConfig_ = std::move(config);
}

bool Subscription::isPush() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !pushConfig_.empty();
}

SubscriptionInfo Subscription::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionInfo result;
    result.name = name_;
    result.topic = topic_;
    result.push_config = pushConfig_;
    result.ack_deadline_seconds = ackDeadlineSeconds_;
    return result;
}

// =============================================================================
// Delivery
// =============================================================================

bool Subscription::enqueue(MessagePtr message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        backlog_.push(std::move(message));
    }
    cv_.notify_all();
    return true;
}

std::vector<ReceivedMessage> Subscription::leaseBatch(size_t maxMessages, TimePoint now) {
    std::vector<ReceivedMessage> result;

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return result;
    }

    TimePoint expiry = now + std::chrono::seconds(ackDeadlineSeconds_);
    while (result.size() < maxMessages) {
        auto entry = backlog_.pop();
        if (!entry) {
            break;
        }

        ReceivedMessage received;
        received.message = entry->message;
        received.delivery_attempt = entry->delivery_attempts;

        entry->delivery_attempts++;
        received.ack_id = leases_.create(std::move(*entry), expiry);
        result.push_back(std::move(received));
    }

    totalLeased_ += result.size();
    if (!result.empty()) {
        LOG_TRACE("Subscription", "{}: leased {} message(s), backlog={}, leases={}",
                  name_, result.size(), backlog_.size(), leases_.size());
    }
    return result;
}

size_t Subscription::acknowledge(const std::vector<std::string>& ackIds) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (const auto& ackId : ackIds) {
        if (leases_.remove(ackId)) {
            ++removed;
        }
    }
    totalAcked_ += removed;
    return removed;
}

size_t Subscription::modifyAckDeadline(const std::vector<std::string>& ackIds,
                                       std::chrono::seconds offset,
                                       TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t updated = 0;
    for (const auto& ackId : ackIds) {
        if (leases_.setExpiry(ackId, now + offset)) {
            ++updated;
        }
    }
    return updated;
}

size_t Subscription::requeueExpired(TimePoint now) {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return 0;
        }

        auto expired = leases_.takeExpired(now);
        count = expired.size();
        for (auto& entry : expired) {
            backlog_.requeue(std::move(entry));
        }
        totalExpired_ += count;
    }

    if (count > 0) {
        LOG_DEBUG("Subscription", "{}: requeued {} expired lease(s)", name_, count);
        cv_.notify_all();
    }
    return count;
}

Subscription::WaitResult Subscription::waitForMessages(TimePoint deadline,
                                                       CancellationToken* token) {
    // Clears the hook on every exit path so cancel() never reaches into a
    // subscription the waiter has let go of.
    struct HookGuard {
        CancellationToken* token;
        ~HookGuard() {
            if (token) {
                token->clearHook();
            }
        }
    } guard{token};

    if (token) {
        token->setHook([this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        });
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [&]() {
        return closed_ || !backlog_.empty() || (token && token->isCancelled());
    });

    if (closed_) {
        return WaitResult::CLOSED;
    }
    if (token && token->isCancelled()) {
        return WaitResult::CANCELLED;
    }
    // A caller that cannot drain the backlog must still see its deadline.
    if (Clock::now() >= deadline) {
        return WaitResult::TIMED_OUT;
    }
    if (!backlog_.empty()) {
        return WaitResult::READY;
    }
    return WaitResult::TIMED_OUT;
}

// =============================================================================
// Pull admission
// =============================================================================

bool Subscription::tryAcquirePullSlot(uint32_t cap) {
    uint32_t current = activePulls_.load();
    while (current < cap) {
        if (activePulls_.compare_exchange_weak(current, current + 1)) {
            return true;
        }
    }
    return false;
}

void Subscription::releasePullSlot() {
    activePulls_.fetch_sub(1);
}

// =============================================================================
// Lifecycle and inspection
// =============================================================================

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        backlog_.clear();
        leases_.clear();
    }
    cv_.notify_all();
}

bool Subscription::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t Subscription::backlogSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backlog_.size();
}

size_t Subscription::leaseCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leases_.size();
}

std::vector<std::string> Subscription::backlogMessageIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(backlog_.size());
    backlog_.forEach([&ids](const BacklogEntry& entry) {
        ids.push_back(entry.message->message_id);
    });
    return ids;
}

std::vector<std::string> Subscription::leasedMessageIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(leases_.size());
    leases_.forEach([&ids](const Lease& lease) {
        ids.push_back(lease.entry.message->message_id);
    });
    return ids;
}

SubscriptionStats Subscription::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionStats result;
    result.backlog = backlog_.stats();
    result.outstanding_leases = leases_.size();
    result.total_leased = totalLeased_;
    result.total_acked = totalAcked_;
    result.total_expired = totalExpired_;
    result.active_pulls = activePulls_.load();
    return result;
}

}  // namespace core
}  // namespace pubsubd
