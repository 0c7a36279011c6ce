/**
 * @file pull_dispatcher.cpp
 * @brief PullDispatcher implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/core/pull_dispatcher.hpp"
#include "pubsubd/utils/logger.hpp"

#include <algorithm>
#include <chrono>

namespace pubsubd {
namespace core {

namespace {

// Holds one admission slot for the duration of a Pull call.
class PullSlot {
public:
    PullSlot(Subscription& subscription, uint32_t cap)
        : subscription_(subscription)
        , acquired_(subscription.tryAcquirePullSlot(cap))
    {}

    ~PullSlot() {
        if (acquired_) {
            subscription_.releasePullSlot();
        }
    }

    PullSlot(const PullSlot&) = delete;
    PullSlot& operator=(const PullSlot&) = delete;

    bool acquired() const { return acquired_; }

private:
    Subscription& subscription_;
    bool acquired_;
};

}  // namespace

PullDispatcher::PullDispatcher(std::shared_ptr<Registry> registry, PullOptions options)
    : registry_(std::move(registry))
    , options_(options)
{
    // A zero batch or slot count would never make progress.
    options_.max_outstanding_pulls = std::max<uint32_t>(options_.max_outstanding_pulls, 1);
    options_.max_messages_per_pull = std::max(options_.max_messages_per_pull, 1);
    options_.max_pull_wait_ms = std::max<int64_t>(options_.max_pull_wait_ms, 0);

    LOG_DEBUG("PullDispatcher", "Created (max_outstanding={}, max_wait={}ms, max_messages={})",
              options_.max_outstanding_pulls, options_.max_pull_wait_ms,
              options_.max_messages_per_pull);
}

Status PullDispatcher::pull(const std::string& subscription,
                            int32_t maxMessages,
                            bool returnImmediately,
                            std::vector<ReceivedMessage>& out,
                            CancellationToken* token) {
    using Clock = Subscription::Clock;

    out.clear();

    if (maxMessages <= 0) {
        return Status::invalidArgument("max_messages must be positive");
    }

    auto sub = registry_->findSubscription(subscription);
    if (!sub || sub->isClosed()) {
        return Status::notFound("Subscription not found: " + subscription);
    }

    PullSlot slot(*sub, options_.max_outstanding_pulls);
    if (!slot.acquired()) {
        LOG_DEBUG("PullDispatcher", "Rejecting pull on {}: {} pulls outstanding",
                  subscription, sub->activePulls());
        return Status::unavailable("Too many outstanding pull requests for " + subscription);
    }

    size_t limit = static_cast<size_t>(std::min(maxMessages, options_.max_messages_per_pull));
    Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(options_.max_pull_wait_ms);

    while (true) {
        out = sub->leaseBatch(limit, Clock::now());
        if (!out.empty() || returnImmediately) {
            LOG_TRACE("PullDispatcher", "Pull on {} returned {} message(s)", subscription, out.size());
            return Status::OK();
        }

        switch (sub->waitForMessages(deadline, token)) {
            case Subscription::WaitResult::READY:
                // Another consumer may drain first; try again.
                break;
            case Subscription::WaitResult::CANCELLED:
                LOG_DEBUG("PullDispatcher", "Pull on {} cancelled while waiting", subscription);
                return Status::cancelled("Pull cancelled");
            case Subscription::WaitResult::TIMED_OUT:
                return Status::OK();
            case Subscription::WaitResult::CLOSED:
                return Status::notFound("Subscription deleted: " + subscription);
        }
    }
}

}  // namespace core
}  // namespace pubsubd
