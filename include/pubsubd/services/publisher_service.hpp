/**
 * @file publisher_service.hpp
 * @brief gRPC Publisher service (callback API).
 *
 * PublisherServiceImpl serves topic management and publishing:
 * - CreateTopic / GetTopic / DeleteTopic
 * - ListTopics / ListTopicSubscriptions
 * - Publish
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/services/export.hpp"
#include "pubsubd/core/broker.hpp"

#include <grpcpp/grpcpp.h>
#include <memory>

#include "pubsubd/proto/pubsub.grpc.pb.h"

namespace pubsubd {
namespace services {

/**
 * @class PublisherServiceImpl
 * @brief Adapts google.pubsub.v1.Publisher onto a core::Broker.
 *
 * Usage:
 * @code
 * auto broker = std::make_shared<core::Broker>(options, transport);
 * PublisherServiceImpl publisher(broker);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("0.0.0.0:8085", grpc::InsecureServerCredentials());
 * builder.RegisterService(&publisher);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class PUBSUBD_SERVICES_API PublisherServiceImpl final
    : public ::google::pubsub::v1::Publisher::CallbackService {
public:
    explicit PublisherServiceImpl(std::shared_ptr<core::Broker> broker);
    ~PublisherServiceImpl() override;

    // =========================================================================
    // gRPC Service Methods (Async Callback API)
    // =========================================================================

    grpc::ServerUnaryReactor* CreateTopic(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::Topic* request,
        ::google::pubsub::v1::Topic* response) override;

    /**
     * @brief Handle Publish RPC.
     * Appends the batch and fans it out to the topic's subscriptions.
     */
    grpc::ServerUnaryReactor* Publish(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::PublishRequest* request,
        ::google::pubsub::v1::PublishResponse* response) override;

    grpc::ServerUnaryReactor* GetTopic(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::GetTopicRequest* request,
        ::google::pubsub::v1::Topic* response) override;

    grpc::ServerUnaryReactor* ListTopics(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::ListTopicsRequest* request,
        ::google::pubsub::v1::ListTopicsResponse* response) override;

    grpc::ServerUnaryReactor* ListTopicSubscriptions(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::ListTopicSubscriptionsRequest* request,
        ::google::pubsub::v1::ListTopicSubscriptionsResponse* response) override;

    grpc::ServerUnaryReactor* DeleteTopic(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::DeleteTopicRequest* request,
        ::google::protobuf::Empty* response) override;

private:
    std::shared_ptr<core::Broker> broker_;
};

}  // namespace services
}  // namespace pubsubd
