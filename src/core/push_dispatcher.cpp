/**
 * @file push_dispatcher.cpp
 * @brief PushDispatcher implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/core/push_dispatcher.hpp"
#include "pubsubd/utils/logger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace pubsubd {
namespace core {

PushDispatcher::PushDispatcher(std::shared_ptr<PushTransport> transport, PushOptions options)
    : transport_(std::move(transport))
    , options_(options)
{
    options_.batch_size = std::max<uint32_t>(options_.batch_size, 1);
    options_.idle_wait_ms = std::max<int64_t>(options_.idle_wait_ms, 1);
}

PushDispatcher::~PushDispatcher() {
    stop();
}

namespace {

template <typename LoopPtr>
void joinLoops(std::vector<LoopPtr>& loops) {
    for (auto& loop : loops) {
        if (loop->thread.joinable()) {
            loop->thread.join();
        }
    }
}

}  // namespace

void PushDispatcher::watch(const std::shared_ptr<Subscription>& subscription) {
    if (!subscription || !subscription->isPush()) {
        return;
    }

    std::vector<std::unique_ptr<Loop>> reaped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }

        takeFinished(reaped);

        if (loops_.count(subscription.get()) == 0) {
            auto loop = std::make_unique<Loop>();
            loop->subscription = subscription;
            Loop* raw = loop.get();
            loops_.emplace(subscription.get(), std::move(loop));
            raw->thread = std::thread(&PushDispatcher::run, this, raw);
        }
    }

    joinLoops(reaped);
}

void PushDispatcher::reapFinished() {
    std::vector<std::unique_ptr<Loop>> reaped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        takeFinished(reaped);
    }

    joinLoops(reaped);
    if (!reaped.empty()) {
        LOG_DEBUG("PushDispatcher", "Reaped {} finished push loop(s)", reaped.size());
    }
}

void PushDispatcher::takeFinished(std::vector<std::unique_ptr<Loop>>& reaped) {
    // Collect loops whose thread has already left run().
    for (auto it = loops_.begin(); it != loops_.end();) {
        if (it->second->finished) {
            reaped.push_back(std::move(it->second));
            it = loops_.erase(it);
        } else {
            ++it;
        }
    }
}

void PushDispatcher::stop() {
    std::vector<std::unique_ptr<Loop>> loops;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;

        for (auto& [key, loop] : loops_) {
            loop->stopToken.cancel();
            loops.push_back(std::move(loop));
        }
        loops_.clear();
    }

    joinLoops(loops);

    if (!loops.empty()) {
        LOG_INFO("PushDispatcher", "Stopped {} push loop(s)", loops.size());
    }
}

size_t PushDispatcher::activeLoops() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [key, loop] : loops_) {
        if (!loop->finished) {
            ++count;
        }
    }
    return count;
}

bool PushDispatcher::shouldContinue(Loop* loop) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& subscription = loop->subscription;

    if (loop->stopToken.isCancelled() || subscription->isClosed() || !subscription->isPush()) {
        // The loop no longer pins a deleted subscription.
        loop->subscription.reset();
        loop->finished = true;
        return false;
    }
    return true;
}

void PushDispatcher::run(Loop* loop) {
    using Clock = Subscription::Clock;

    std::shared_ptr<Subscription> subscription = loop->subscription;
    const std::chrono::seconds leaseExtension(subscription->ackDeadlineSeconds());
    LOG_INFO("PushDispatcher", "Push loop started for {}", subscription->name());

    while (shouldContinue(loop)) {
        PushConfig config = subscription->pushConfig();
        auto now = Clock::now();

        auto batch = subscription->leaseBatch(options_.batch_size, now);
        if (batch.empty()) {
            subscription->waitForMessages(now + std::chrono::milliseconds(options_.idle_wait_ms),
                                          &loop->stopToken);
            continue;
        }

        for (auto& received : batch) {
            if (loop->stopToken.isCancelled()) {
                // Undelivered leases expire and return to the backlog.
                break;
            }

            // Earlier deliveries in the batch consume the lease window of
            // later ones; each entry gets a full deadline before its attempt.
            if (subscription->modifyAckDeadline({received.ack_id}, leaseExtension, Clock::now()) == 0) {
                LOG_TRACE("PushDispatcher", "{}: lease on message {} expired before delivery",
                          subscription->name(), received.message->message_id);
                continue;
            }

            PushRequest request;
            request.subscription = subscription->name();
            request.config = config;
            request.message = std::move(received);
            request.timeout = leaseExtension;

            bool delivered = false;
            try {
                delivered = transport_->deliver(request);
            } catch (const std::exception& e) {
                LOG_WARN("PushDispatcher", "Transport error pushing {} to {}: {}",
                         request.message.message->message_id, config.push_endpoint, e.what());
            }

            if (delivered) {
                subscription->acknowledge({request.message.ack_id});
                totalDelivered_++;
            } else {
                totalFailed_++;
                LOG_DEBUG("PushDispatcher", "{}: delivery of message {} failed, awaiting redelivery",
                          subscription->name(), request.message.message->message_id);
            }
        }
    }

    LOG_INFO("PushDispatcher", "Push loop stopped for {}", subscription->name());
}

}  // namespace core
}  // namespace pubsubd
