/**
 * @file types.hpp
 * @brief Value types shared by the delivery engine and the RPC layer.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pubsubd {
namespace core {

/// Topic reported by subscriptions whose topic was deleted.
inline const std::string kDeletedTopic = "_deleted-topic_";

/**
 * @struct Message
 * @brief A published message. Immutable once stored in a Message Log.
 */
struct Message {
    std::string message_id;                         ///< Broker-assigned, unique within the topic
    std::string data;                               ///< Opaque payload
    std::map<std::string, std::string> attributes;
    std::chrono::system_clock::time_point publish_time;
};

using MessagePtr = std::shared_ptr<const Message>;

/**
 * @struct OutgoingMessage
 * @brief What a publisher supplies for one message.
 */
struct OutgoingMessage {
    std::string data;
    std::map<std::string, std::string> attributes;
    std::string message_id;  ///< Must be left empty by publishers
};

/**
 * @struct PushConfig
 * @brief Push endpoint configuration. An empty endpoint means pull mode.
 */
struct PushConfig {
    std::string push_endpoint;
    std::map<std::string, std::string> attributes;

    bool empty() const { return push_endpoint.empty(); }

    bool operator==(const PushConfig& other) const {
        return push_endpoint == other.push_endpoint && attributes == other.attributes;
    }
};

/**
 * @struct ReceivedMessage
 * @brief One leased delivery handed to a puller or push loop.
 */
struct ReceivedMessage {
    std::string ack_id;
    MessagePtr message;
    int32_t delivery_attempt = 0;  ///< Earlier delivery attempts on this subscription
};

/**
 * @struct TopicInfo
 * @brief Control-plane view of a topic.
 */
struct TopicInfo {
    std::string name;
};

/**
 * @struct SubscriptionInfo
 * @brief Control-plane view of a subscription.
 */
struct SubscriptionInfo {
    std::string name;
    std::string topic;
    PushConfig push_config;
    int32_t ack_deadline_seconds = 0;
};

/**
 * @struct ListPage
 * @brief One page of a name-ordered listing.
 */
template<typename T>
struct ListPage {
    std::vector<T> items;
    std::string next_page_token;  ///< Empty when the listing is exhausted
};

}  // namespace core
}  // namespace pubsubd
