/**
 * @file broker.cpp
 * @brief Broker implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/core/broker.hpp"
#include "pubsubd/utils/logger.hpp"
#include "pubsubd/utils/uuid.hpp"

#include <algorithm>
#include <chrono>

namespace pubsubd {
namespace core {

namespace {

const std::string kProjectsPrefix = "projects/";

// Deadlines and the sweep period must be positive; the default deadline
// must lie within the maximum.
BrokerOptions normalizeOptions(BrokerOptions options) {
    options.max_ack_deadline_seconds = std::max(options.max_ack_deadline_seconds, 1);
    options.default_ack_deadline_seconds = std::clamp(
        options.default_ack_deadline_seconds, 1, options.max_ack_deadline_seconds);
    options.sweep_interval_ms = std::max<int64_t>(options.sweep_interval_ms, 1);
    return options;
}

}  // namespace

Broker::Broker(BrokerOptions options, std::shared_ptr<PushTransport> pushTransport)
    : options_(normalizeOptions(options))
    , registry_(std::make_shared<Registry>(options_.registry))
    , pullDispatcher_(registry_, options_.pull)
    , sweeper_(registry_, std::chrono::milliseconds(options_.sweep_interval_ms))
    , pushTransport_(std::move(pushTransport))
{
    if (pushTransport_) {
        pushDispatcher_ = std::make_unique<PushDispatcher>(pushTransport_, options_.push);
    } else {
        LOG_WARN("Broker", "No push transport configured; push subscriptions will not be delivered");
    }
}

Broker::~Broker() {
    stop();
}

void Broker::start() {
    sweeper_.start();
    LOG_INFO("Broker", "Broker started (ack_deadline={}s/{}s, max_pulls={}, sweep={}ms)",
             options_.default_ack_deadline_seconds, options_.max_ack_deadline_seconds,
             options_.pull.max_outstanding_pulls, options_.sweep_interval_ms);
}

void Broker::stop() {
    sweeper_.stop();
    if (pushDispatcher_) {
        pushDispatcher_->stop();
    }
}

// =============================================================================
// Publisher
// =============================================================================

Status Broker::createTopic(const std::string& name, TopicInfo& out) {
    return registry_->createTopic(name, out);
}

Status Broker::getTopic(const std::string& name, TopicInfo& out) {
    return registry_->getTopic(name, out);
}

Status Broker::listTopics(const std::string& project, int32_t pageSize,
                          const std::string& pageToken, ListPage<TopicInfo>& out) {
    return registry_->listTopics(project, pageSize, pageToken, out);
}

Status Broker::listTopicSubscriptions(const std::string& topic, int32_t pageSize,
                                      const std::string& pageToken, ListPage<std::string>& out) {
    return registry_->listTopicSubscriptions(topic, pageSize, pageToken, out);
}

Status Broker::deleteTopic(const std::string& name) {
    return registry_->deleteTopic(name);
}

Status Broker::publish(const std::string& topic,
                       const std::vector<OutgoingMessage>& messages,
                       std::vector<std::string>& outIds) {
    outIds.clear();

    if (messages.empty()) {
        return Status::invalidArgument("Publish requires at least one message");
    }
    for (const auto& message : messages) {
        if (!message.message_id.empty()) {
            return Status::invalidArgument("message_id is assigned by the server");
        }
    }

    PublishScope scope = registry_->beginPublish(topic);
    if (!scope.valid()) {
        return Status::notFound("Topic not found: " + topic);
    }

    auto now = std::chrono::system_clock::now();
    outIds.reserve(messages.size());

    for (const auto& outgoing : messages) {
        MessagePtr message = scope.log().append(outgoing, now);
        for (const auto& subscription : scope.subscriptions()) {
            subscription->enqueue(message);
        }
        outIds.push_back(message->message_id);
    }

    LOG_DEBUG("Broker", "Published {} message(s) to {} ({} subscription(s))",
              messages.size(), topic, scope.subscriptions().size());
    return Status::OK();
}

// =============================================================================
// Subscriber
// =============================================================================

std::string Broker::generateSubscriptionName(const std::string& topic) const {
    std::string id = utils::UUIDGenerator::generate();

    if (topic.compare(0, kProjectsPrefix.size(), kProjectsPrefix) == 0) {
        size_t slash = topic.find('/', kProjectsPrefix.size());
        if (slash != std::string::npos && slash > kProjectsPrefix.size()) {
            return topic.substr(0, slash) + "/subscriptions/" + id;
        }
    }
    return id;
}

bool Broker::pushEndpointSupported(const PushConfig& config) const {
    // Without a transport, push backlogs accumulate for any endpoint.
    return !pushTransport_ || pushTransport_->supportsEndpoint(config.push_endpoint);
}

Status Broker::createSubscription(const SubscriptionInfo& request, SubscriptionInfo& out) {
    if (request.ack_deadline_seconds < 0) {
        return Status::invalidArgument("ack_deadline_seconds must not be negative");
    }

    if (!request.push_config.empty() && !pushEndpointSupported(request.push_config)) {
        return Status::invalidArgument("Unsupported push endpoint: " +
                                       request.push_config.push_endpoint);
    }

    SubscriptionInfo normalized = request;
    if (normalized.name.empty()) {
        normalized.name = generateSubscriptionName(normalized.topic);
    }
    if (normalized.ack_deadline_seconds == 0) {
        normalized.ack_deadline_seconds = options_.default_ack_deadline_seconds;
    }
    normalized.ack_deadline_seconds =
        std::min(normalized.ack_deadline_seconds, options_.max_ack_deadline_seconds);

    std::shared_ptr<Subscription> subscription;
    Status status = registry_->createSubscription(normalized, subscription);
    if (!status.ok()) {
        return status;
    }

    if (subscription->isPush() && pushDispatcher_) {
        pushDispatcher_->watch(subscription);
    }

    out = subscription->info();
    return Status::OK();
}

Status Broker::getSubscription(const std::string& name, SubscriptionInfo& out) {
    auto subscription = registry_->findSubscription(name);
    if (!subscription) {
        return Status::notFound("Subscription not found: " + name);
    }
    out = subscription->info();
    return Status::OK();
}

Status Broker::listSubscriptions(const std::string& project, int32_t pageSize,
                                 const std::string& pageToken, ListPage<SubscriptionInfo>& out) {
    return registry_->listSubscriptions(project, pageSize, pageToken, out);
}

Status Broker::deleteSubscription(const std::string& name) {
    Status status = registry_->deleteSubscription(name);
    if (status.ok() && pushDispatcher_) {
        pushDispatcher_->reapFinished();
    }
    return status;
}

Status Broker::modifyPushConfig(const std::string& name, const PushConfig& config) {
    auto subscription = registry_->findSubscription(name);
    if (!subscription) {
        return Status::notFound("Subscription not found: " + name);
    }
    if (!config.empty() && !pushEndpointSupported(config)) {
        return Status::invalidArgument("Unsupported push endpoint: " + config.push_endpoint);
    }

    subscription->setPushConfig(config);
    LOG_INFO("Broker", "Push config of {} set to {}", name,
             config.empty() ? std::string("pull") : config.push_endpoint);

    if (pushDispatcher_) {
        pushDispatcher_->reapFinished();
        if (!config.empty()) {
            pushDispatcher_->watch(subscription);
        }
    }
    return Status::OK();
}

Status Broker::pull(const std::string& subscription,
                    int32_t maxMessages,
                    bool returnImmediately,
                    std::vector<ReceivedMessage>& out,
                    CancellationToken* token) {
    return pullDispatcher_.pull(subscription, maxMessages, returnImmediately, out, token);
}

Status Broker::acknowledge(const std::string& subscription,
                           const std::vector<std::string>& ackIds) {
    auto sub = registry_->findSubscription(subscription);
    if (!sub) {
        return Status::notFound("Subscription not found: " + subscription);
    }

    size_t removed = sub->acknowledge(ackIds);
    LOG_TRACE("Broker", "{}: acknowledged {}/{} id(s)", subscription, removed, ackIds.size());
    return Status::OK();
}

Status Broker::modifyAckDeadline(const std::string& subscription,
                                 const std::vector<std::string>& ackIds,
                                 int32_t ackDeadlineSeconds) {
    if (ackDeadlineSeconds < 0) {
        return Status::invalidArgument("ack_deadline_seconds must not be negative");
    }

    auto sub = registry_->findSubscription(subscription);
    if (!sub) {
        return Status::notFound("Subscription not found: " + subscription);
    }

    int32_t seconds = std::min(ackDeadlineSeconds, options_.max_ack_deadline_seconds);
    size_t updated = sub->modifyAckDeadline(ackIds, std::chrono::seconds(seconds),
                                            Subscription::Clock::now());
    LOG_TRACE("Broker", "{}: deadline of {}/{} lease(s) set to {}s",
              subscription, updated, ackIds.size(), seconds);
    return Status::OK();
}

size_t Broker::sweepExpired() {
    return sweeper_.sweepOnce();
}

void Broker::logStats() const {
    std::string token;
    do {
        ListPage<TopicInfo> page;
        if (!registry_->listTopics("", 0, token, page).ok()) {
            break;
        }
        for (const auto& topic : page.items) {
            TopicStats stats;
            if (registry_->topicStats(topic.name, stats)) {
                LOG_INFO("Broker", "Topic {}: published={}, retained={} ({} bytes), subscriptions={}",
                         stats.name, stats.published, stats.retained, stats.retained_bytes,
                         stats.bound_subscriptions);
            }
        }
        token = page.next_page_token;
    } while (!token.empty());

    for (const auto& subscription : registry_->allSubscriptions()) {
        SubscriptionStats stats = subscription->stats();
        LOG_INFO("Broker", "Subscription {}: backlog={}, leases={}, leased={}, acked={}, expired={}",
                 subscription->name(), stats.backlog.current_depth, stats.outstanding_leases,
                 stats.total_leased, stats.total_acked, stats.total_expired);
    }
}

}  // namespace core
}  // namespace pubsubd
