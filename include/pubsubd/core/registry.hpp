/**
 * @file registry.hpp
 * @brief Topic and subscription namespaces with the topic -> subscription index.
 *
 * The Registry maintains:
 * - Live topics, each with its Message Log and binding index
 * - Subscriptions by name
 * - Name-ordered, paginated listings
 *
 * Locking: a registry-wide shared_mutex guards both namespaces. Create and
 * delete take it exclusively; publishing holds it shared for the whole
 * fan-out, which makes "subscription becomes bound" and "message appended
 * to backlogs" ordered with respect to each other. A per-topic mutex then
 * orders concurrent publishes to the same topic. Lock order is
 * registry -> topic -> subscription.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/core/export.hpp"
#include "pubsubd/core/message_log.hpp"
#include "pubsubd/core/status.hpp"
#include "pubsubd/core/subscription.hpp"
#include "pubsubd/core/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace pubsubd {
namespace core {

/**
 * @struct Topic
 * @brief A live topic: its log and the names of subscriptions bound to it.
 */
struct Topic {
    Topic(std::string topicName, uint32_t retention)
        : name(std::move(topicName)), log(retention) {}

    const std::string name;
    std::mutex mutex;                     ///< Guards log and subscriptions
    MessageLog log;
    std::set<std::string> subscriptions;  ///< Binding index
};

/**
 * @brief Per-topic counters.
 */
struct TopicStats {
    std::string name;
    uint64_t published = 0;
    size_t retained = 0;
    size_t retained_bytes = 0;
    size_t bound_subscriptions = 0;
};

/**
 * @brief Registry tuning.
 */
struct RegistryOptions {
    uint32_t message_log_retention = 1000;
    int32_t default_page_size = 100;
    int32_t max_page_size = 1000;
};

/**
 * @class PublishScope
 * @brief Holds a topic open for one publish call.
 *
 * While the scope lives, no subscription can be bound to or unbound from
 * the topic and no other publish to it can interleave.
 */
class PUBSUBD_CORE_API PublishScope {
public:
    PublishScope() = default;
    PublishScope(PublishScope&&) = default;
    PublishScope& operator=(PublishScope&&) = default;

    bool valid() const { return topic_ != nullptr; }

    MessageLog& log() { return topic_->log; }

    /**
     * @brief Subscriptions bound at the moment the scope was opened.
     */
    const std::vector<std::shared_ptr<Subscription>>& subscriptions() const {
        return subscriptions_;
    }

private:
    friend class Registry;

    std::shared_lock<std::shared_mutex> registryLock_;
    std::shared_ptr<Topic> topic_;
    std::unique_lock<std::mutex> topicLock_;
    std::vector<std::shared_ptr<Subscription>> subscriptions_;
};

/**
 * @class Registry
 * @brief Thread-safe control-plane state.
 *
 * Usage:
 * @code
 * Registry registry;
 * TopicInfo topic;
 * registry.createTopic("projects/p/topics/orders", topic);
 *
 * std::shared_ptr<Subscription> sub;
 * SubscriptionInfo request{"projects/p/subscriptions/billing", topic.name, {}, 60};
 * registry.createSubscription(request, sub);
 * @endcode
 */
class PUBSUBD_CORE_API Registry {
public:
    explicit Registry(RegistryOptions options = {});
    ~Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // =========================================================================
    // Topics
    // =========================================================================

    /**
     * @return ALREADY_EXISTS if a live topic has this name.
     */
    Status createTopic(const std::string& name, TopicInfo& out);

    /**
     * @return NOT_FOUND if absent.
     */
    Status getTopic(const std::string& name, TopicInfo& out) const;

    /**
     * @brief Remove a topic. Bound subscriptions report kDeletedTopic.
     *
     * Idempotent: deleting an absent topic succeeds.
     */
    Status deleteTopic(const std::string& name);

    Status listTopics(const std::string& project,
                      int32_t pageSize,
                      const std::string& pageToken,
                      ListPage<TopicInfo>& out) const;

    /**
     * @return NOT_FOUND if the topic is absent.
     */
    Status listTopicSubscriptions(const std::string& topic,
                                  int32_t pageSize,
                                  const std::string& pageToken,
                                  ListPage<std::string>& out) const;

    bool topicStats(const std::string& name, TopicStats& out) const;

    /**
     * @brief Lock a topic for publishing.
     * @return An invalid scope if the topic is absent.
     */
    PublishScope beginPublish(const std::string& topic) const;

    // =========================================================================
    // Subscriptions
    // =========================================================================

    /**
     * @brief Create and bind a subscription. @p request must be normalized
     * (non-empty name, positive ack deadline).
     * @return ALREADY_EXISTS on duplicate name, NOT_FOUND if the topic is absent.
     */
    Status createSubscription(const SubscriptionInfo& request,
                              std::shared_ptr<Subscription>& out);

    /**
     * @return The subscription, or nullptr if absent.
     */
    std::shared_ptr<Subscription> findSubscription(const std::string& name) const;

    /**
     * @brief Unbind, remove and close a subscription. Idempotent.
     */
    Status deleteSubscription(const std::string& name);

    Status listSubscriptions(const std::string& project,
                             int32_t pageSize,
                             const std::string& pageToken,
                             ListPage<SubscriptionInfo>& out) const;

    /**
     * @brief Snapshot of every live subscription.
     */
    std::vector<std::shared_ptr<Subscription>> allSubscriptions() const;

    size_t topicCount() const;
    size_t subscriptionCount() const;

private:
    /**
     * @brief Resolve page size and start key from request fields.
     */
    Status resolvePage(int32_t pageSize,
                       const std::string& pageToken,
                       size_t& outLimit,
                       std::string& outStartAfter) const;

    RegistryOptions options_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<Topic>> topics_;
    std::map<std::string, std::shared_ptr<Subscription>> subscriptions_;
};

}  // namespace core
}  // namespace pubsubd
