/**
 * @file subscriber_service.hpp
 * @brief gRPC Subscriber service (callback API).
 *
 * SubscriberServiceImpl serves subscription management and consumption:
 * - CreateSubscription / GetSubscription / ListSubscriptions / DeleteSubscription
 * - ModifyPushConfig
 * - Pull / Acknowledge / ModifyAckDeadline
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/services/export.hpp"
#include "pubsubd/core/broker.hpp"
#include "pubsubd/utils/worker_pool.hpp"

#include <grpcpp/grpcpp.h>
#include <cstddef>
#include <memory>

#include "pubsubd/proto/pubsub.grpc.pb.h"

namespace pubsubd {
namespace services {

/**
 * @class SubscriberServiceImpl
 * @brief Adapts google.pubsub.v1.Subscriber onto a core::Broker.
 *
 * A Pull that may block runs on a bounded worker pool so callback
 * threads are never parked; cancelling the RPC cancels the wait. When
 * every worker is busy the Pull fails with UNAVAILABLE.
 */
class PUBSUBD_SERVICES_API SubscriberServiceImpl final
    : public ::google::pubsub::v1::Subscriber::CallbackService {
public:
    /**
     * @param maxBlockingPulls Worker threads available to waiting Pulls.
     */
    explicit SubscriberServiceImpl(std::shared_ptr<core::Broker> broker,
                                   size_t maxBlockingPulls = 256);
    ~SubscriberServiceImpl() override;

    // =========================================================================
    // gRPC Service Methods (Async Callback API)
    // =========================================================================

    grpc::ServerUnaryReactor* CreateSubscription(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::Subscription* request,
        ::google::pubsub::v1::Subscription* response) override;

    grpc::ServerUnaryReactor* GetSubscription(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::GetSubscriptionRequest* request,
        ::google::pubsub::v1::Subscription* response) override;

    grpc::ServerUnaryReactor* ListSubscriptions(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::ListSubscriptionsRequest* request,
        ::google::pubsub::v1::ListSubscriptionsResponse* response) override;

    grpc::ServerUnaryReactor* DeleteSubscription(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::DeleteSubscriptionRequest* request,
        ::google::protobuf::Empty* response) override;

    grpc::ServerUnaryReactor* ModifyAckDeadline(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::ModifyAckDeadlineRequest* request,
        ::google::protobuf::Empty* response) override;

    grpc::ServerUnaryReactor* Acknowledge(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::AcknowledgeRequest* request,
        ::google::protobuf::Empty* response) override;

    /**
     * @brief Handle Pull RPC.
     * Leases up to max_messages; waits for a publish unless
     * return_immediately is set.
     */
    grpc::ServerUnaryReactor* Pull(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::PullRequest* request,
        ::google::pubsub::v1::PullResponse* response) override;

    grpc::ServerUnaryReactor* ModifyPushConfig(
        grpc::CallbackServerContext* context,
        const ::google::pubsub::v1::ModifyPushConfigRequest* request,
        ::google::protobuf::Empty* response) override;

private:
    std::shared_ptr<core::Broker> broker_;
    utils::WorkerPool pullWorkers_;
};

}  // namespace services
}  // namespace pubsubd
