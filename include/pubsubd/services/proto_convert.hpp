/**
 * @file proto_convert.hpp
 * @brief Mapping between core types and the google.pubsub.v1 wire types.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/services/export.hpp"
#include "pubsubd/core/status.hpp"
#include "pubsubd/core/types.hpp"

#include <grpcpp/grpcpp.h>

#include "pubsubd/proto/pubsub.pb.h"

namespace pubsubd {
namespace services {

namespace pb = ::google::pubsub::v1;

/**
 * @brief Map a core status onto the gRPC status with the same meaning.
 */
PUBSUBD_SERVICES_API grpc::Status toGrpcStatus(const core::Status& status);

PUBSUBD_SERVICES_API core::OutgoingMessage fromProto(const pb::PubsubMessage& message);
PUBSUBD_SERVICES_API core::PushConfig fromProto(const pb::PushConfig& config);
PUBSUBD_SERVICES_API core::SubscriptionInfo fromProto(const pb::Subscription& subscription);

PUBSUBD_SERVICES_API void toProto(const core::Message& message, pb::PubsubMessage* out);
PUBSUBD_SERVICES_API void toProto(const core::PushConfig& config, pb::PushConfig* out);
PUBSUBD_SERVICES_API void toProto(const core::SubscriptionInfo& info, pb::Subscription* out);
PUBSUBD_SERVICES_API void toProto(const core::ReceivedMessage& received, pb::ReceivedMessage* out);

}  // namespace services
}  // namespace pubsubd
