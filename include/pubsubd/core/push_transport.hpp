/**
 * @file push_transport.hpp
 * @brief Outbound delivery seam for push subscriptions.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/core/types.hpp"

#include <chrono>
#include <string>

namespace pubsubd {
namespace core {

/**
 * @brief One message addressed to a push endpoint.
 */
struct PushRequest {
    std::string subscription;
    PushConfig config;
    ReceivedMessage message;
    std::chrono::milliseconds timeout{0};  ///< Bounded by the ack deadline
};

/**
 * @class PushTransport
 * @brief Delivers a message to an endpoint and reports the outcome.
 *
 * Implementations must be safe to call from several push loops at once.
 */
class PushTransport {
public:
    virtual ~PushTransport() = default;

    /**
     * @return true if the endpoint accepted the message.
     */
    virtual bool deliver(const PushRequest& request) = 0;

    /**
     * @brief Whether deliver() can reach @p endpoint at all. Subscriptions
     * naming an unsupported endpoint are refused up front.
     */
    virtual bool supportsEndpoint(const std::string& endpoint) const {
        return !endpoint.empty();
    }
};

}  // namespace core
}  // namespace pubsubd
