/**
 * @file broker.hpp
 * @brief Delivery engine facade: every Publisher and Subscriber operation.
 *
 * The Broker owns the control-plane Registry together with the Pull
 * Dispatcher, the Expiry Sweeper and the Push Dispatcher, and exposes the
 * RPC-level operations in transport-neutral form. The gRPC services are
 * thin adapters over it.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/core/export.hpp"
#include "pubsubd/core/cancellation.hpp"
#include "pubsubd/core/expiry_sweeper.hpp"
#include "pubsubd/core/pull_dispatcher.hpp"
#include "pubsubd/core/push_dispatcher.hpp"
#include "pubsubd/core/push_transport.hpp"
#include "pubsubd/core/registry.hpp"
#include "pubsubd/core/status.hpp"
#include "pubsubd/core/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pubsubd {
namespace core {

/**
 * @brief Engine configuration.
 */
struct BrokerOptions {
    int32_t default_ack_deadline_seconds = 60;
    int32_t max_ack_deadline_seconds = 600;
    int64_t sweep_interval_ms = 100;
    PullOptions pull;
    PushOptions push;
    RegistryOptions registry;
};

/**
 * @class Broker
 * @brief Publish/subscribe delivery engine.
 *
 * Usage:
 * @code
 * Broker broker(BrokerOptions{}, std::make_shared<HttpPushTransport>());
 * broker.start();
 *
 * TopicInfo topic;
 * broker.createTopic("projects/p/topics/orders", topic);
 *
 * SubscriptionInfo sub;
 * broker.createSubscription({"projects/p/subscriptions/billing", topic.name, {}, 0}, sub);
 *
 * std::vector<std::string> ids;
 * broker.publish(topic.name, {OutgoingMessage{"payload", {}, ""}}, ids);
 *
 * std::vector<ReceivedMessage> received;
 * broker.pull(sub.name, 10, true, received);
 * @endcode
 */
class PUBSUBD_CORE_API Broker {
public:
    /**
     * @param pushTransport Delivery transport for push subscriptions. When
     *        null, push subscriptions accumulate their backlog undelivered.
     */
    Broker(BrokerOptions options, std::shared_ptr<PushTransport> pushTransport);
    ~Broker();

    Broker(const Broker&) = delete;
    Broker& operator=(const Broker&) = delete;

    /**
     * @brief Start the expiry sweeper.
     */
    void start();

    /**
     * @brief Stop background activity (sweeper and push loops).
     */
    void stop();

    // =========================================================================
    // Publisher
    // =========================================================================

    Status createTopic(const std::string& name, TopicInfo& out);
    Status getTopic(const std::string& name, TopicInfo& out);
    Status listTopics(const std::string& project, int32_t pageSize,
                      const std::string& pageToken, ListPage<TopicInfo>& out);
    Status listTopicSubscriptions(const std::string& topic, int32_t pageSize,
                                  const std::string& pageToken, ListPage<std::string>& out);
    Status deleteTopic(const std::string& name);

    /**
     * @brief Append @p messages to the topic and fan them out to every
     * subscription bound at this moment.
     * @param outIds Assigned message ids, in input order.
     */
    Status publish(const std::string& topic,
                   const std::vector<OutgoingMessage>& messages,
                   std::vector<std::string>& outIds);

    // =========================================================================
    // Subscriber
    // =========================================================================

    /**
     * @brief Create a subscription. An empty name is replaced by a
     * generated one; a zero ack deadline selects the default. A push
     * endpoint the transport cannot reach is INVALID_ARGUMENT.
     */
    Status createSubscription(const SubscriptionInfo& request, SubscriptionInfo& out);
    Status getSubscription(const std::string& name, SubscriptionInfo& out);
    Status listSubscriptions(const std::string& project, int32_t pageSize,
                             const std::string& pageToken, ListPage<SubscriptionInfo>& out);
    Status deleteSubscription(const std::string& name);
    Status modifyPushConfig(const std::string& name, const PushConfig& config);

    Status pull(const std::string& subscription,
                int32_t maxMessages,
                bool returnImmediately,
                std::vector<ReceivedMessage>& out,
                CancellationToken* token = nullptr);

    Status acknowledge(const std::string& subscription, const std::vector<std::string>& ackIds);

    Status modifyAckDeadline(const std::string& subscription,
                             const std::vector<std::string>& ackIds,
                             int32_t ackDeadlineSeconds);

    // =========================================================================
    // Engine access
    // =========================================================================

    /**
     * @brief Run one expiry pass immediately.
     */
    size_t sweepExpired();

    /**
     * @brief Log per-topic and per-subscription counters at INFO.
     */
    void logStats() const;

    Registry& registry() { return *registry_; }
    PushDispatcher* pushDispatcher() { return pushDispatcher_.get(); }
    const BrokerOptions& options() const { return options_; }

private:
    std::string generateSubscriptionName(const std::string& topic) const;
    bool pushEndpointSupported(const PushConfig& config) const;

    BrokerOptions options_;
    std::shared_ptr<Registry> registry_;
    PullDispatcher pullDispatcher_;
    ExpirySweeper sweeper_;
    std::shared_ptr<PushTransport> pushTransport_;
    std::unique_ptr<PushDispatcher> pushDispatcher_;
};

}  // namespace core
}  // namespace pubsubd
