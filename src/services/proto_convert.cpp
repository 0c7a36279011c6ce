/**
 * @file proto_convert.cpp
 * @brief Core <-> wire type conversions.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/services/proto_convert.hpp"

#include <chrono>

namespace pubsubd {
namespace services {

grpc::Status toGrpcStatus(const core::Status& status) {
    switch (status.code()) {
        case core::StatusCode::OK:
            return grpc::Status::OK;
        case core::StatusCode::INVALID_ARGUMENT:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, status.message());
        case core::StatusCode::NOT_FOUND:
            return grpc::Status(grpc::StatusCode::NOT_FOUND, status.message());
        case core::StatusCode::ALREADY_EXISTS:
            return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, status.message());
        case core::StatusCode::UNAVAILABLE:
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, status.message());
        case core::StatusCode::CANCELLED:
            return grpc::Status(grpc::StatusCode::CANCELLED, status.message());
    }
    return grpc::Status(grpc::StatusCode::UNKNOWN, status.message());
}

core::OutgoingMessage fromProto(const pb::PubsubMessage& message) {
    core::OutgoingMessage result;
    result.data = message.data();
    for (const auto& attribute : message.attributes()) {
        result.attributes[attribute.first] = attribute.second;
    }
    result.message_id = message.message_id();
    return result;
}

core::PushConfig fromProto(const pb::PushConfig& config) {
    core::PushConfig result;
    result.push_endpoint = config.push_endpoint();
    for (const auto& attribute : config.attributes()) {
        result.attributes[attribute.first] = attribute.second;
    }
    return result;
}

core::SubscriptionInfo fromProto(const pb::Subscription& subscription) {
    core::SubscriptionInfo result;
    result.name = subscription.name();
    result.topic = subscription.topic();
    if (subscription.has_push_config()) {
        result.push_config = fromProto(subscription.push_config());
    }
    result.ack_deadline_seconds = subscription.ack_deadline_seconds();
    return result;
}

void toProto(const core::Message& message, pb::PubsubMessage* out) {
    out->set_data(message.data);
    auto* attributes = out->mutable_attributes();
    for (const auto& [key, value] : message.attributes) {
        (*attributes)[key] = value;
    }
    out->set_message_id(message.message_id);

    auto sinceEpoch = message.publish_time.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch - seconds);
    out->mutable_publish_time()->set_seconds(seconds.count());
    out->mutable_publish_time()->set_nanos(static_cast<int32_t>(nanos.count()));
}

void toProto(const core::PushConfig& config, pb::PushConfig* out) {
    out->set_push_endpoint(config.push_endpoint);
    auto* attributes = out->mutable_attributes();
    for (const auto& [key, value] : config.attributes) {
        (*attributes)[key] = value;
    }
}

void toProto(const core::SubscriptionInfo& info, pb::Subscription* out) {
    out->set_name(info.name);
    out->set_topic(info.topic);
    toProto(info.push_config, out->mutable_push_config());
    out->set_ack_deadline_seconds(info.ack_deadline_seconds);
}

void toProto(const core::ReceivedMessage& received, pb::ReceivedMessage* out) {
    out->set_ack_id(received.ack_id);
    toProto(*received.message, out->mutable_message());
    out->set_delivery_attempt(received.delivery_attempt);
}

}  // namespace services
}  // namespace pubsubd
