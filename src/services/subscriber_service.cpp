/**
 * @file subscriber_service.cpp
 * @brief SubscriberServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/services/subscriber_service.hpp"
#include "pubsubd/services/completed_reactor.hpp"
#include "pubsubd/services/proto_convert.hpp"
#include "pubsubd/core/cancellation.hpp"
#include "pubsubd/utils/logger.hpp"

#include <vector>

namespace pubsubd {
namespace services {

SubscriberServiceImpl::SubscriberServiceImpl(std::shared_ptr<core::Broker> broker,
                                             size_t maxBlockingPulls)
    : broker_(std::move(broker))
    , pullWorkers_(maxBlockingPulls)
{
    LOG_DEBUG("SubscriberService", "Service created (max_blocking_pulls={})",
              pullWorkers_.maxWorkers());
}

SubscriberServiceImpl::~SubscriberServiceImpl() {
    pullWorkers_.shutdown();
}

// =============================================================================
// Subscription management
// =============================================================================

grpc::ServerUnaryReactor* SubscriberServiceImpl::CreateSubscription(
    grpc::CallbackServerContext* context,
    const pb::Subscription* request,
    pb::Subscription* response) {

    core::SubscriptionInfo created;
    core::Status status = broker_->createSubscription(fromProto(*request), created);
    if (status.ok()) {
        toProto(created, response);
    }
    return new CompletedReactor(toGrpcStatus(status));
}

grpc::ServerUnaryReactor* SubscriberServiceImpl::GetSubscription(
    grpc::CallbackServerContext* context,
    const pb::GetSubscriptionRequest* request,
    pb::Subscription* response) {

    core::SubscriptionInfo info;
    core::Status status = broker_->getSubscription(request->subscription(), info);
    if (status.ok()) {
        toProto(info, response);
    }
    return new CompletedReactor(toGrpcStatus(status));
}

grpc::ServerUnaryReactor* SubscriberServiceImpl::ListSubscriptions(
    grpc::CallbackServerContext* context,
    const pb::ListSubscriptionsRequest* request,
    pb::ListSubscriptionsResponse* response) {

    core::ListPage<core::SubscriptionInfo> page;
    core::Status status = broker_->listSubscriptions(request->project(), request->page_size(),
                                                     request->page_token(), page);
    if (status.ok()) {
        for (const auto& info : page.items) {
            toProto(info, response->add_subscriptions());
        }
        response->set_next_page_token(page.next_page_token);
    }
    return new CompletedReactor(toGrpcStatus(status));
}

grpc::ServerUnaryReactor* SubscriberServiceImpl::DeleteSubscription(
    grpc::CallbackServerContext* context,
    const pb::DeleteSubscriptionRequest* request,
    ::google::protobuf::Empty* response) {

    return new CompletedReactor(toGrpcStatus(broker_->deleteSubscription(request->subscription())));
}

grpc::ServerUnaryReactor* SubscriberServiceImpl::ModifyPushConfig(
    grpc::CallbackServerContext* context,
    const pb::ModifyPushConfigRequest* request,
    ::google::protobuf::Empty* response) {

    core::Status status = broker_->modifyPushConfig(request->subscription(),
                                                    fromProto(request->push_config()));
    return new CompletedReactor(toGrpcStatus(status));
}

// =============================================================================
// Acknowledge / ModifyAckDeadline
// =============================================================================

grpc::ServerUnaryReactor* SubscriberServiceImpl::Acknowledge(
    grpc::CallbackServerContext* context,
    const pb::AcknowledgeRequest* request,
    ::google::protobuf::Empty* response) {

    std::vector<std::string> ackIds(request->ack_ids().begin(), request->ack_ids().end());
    core::Status status = broker_->acknowledge(request->subscription(), ackIds);
    return new CompletedReactor(toGrpcStatus(status));
}

grpc::ServerUnaryReactor* SubscriberServiceImpl::ModifyAckDeadline(
    grpc::CallbackServerContext* context,
    const pb::ModifyAckDeadlineRequest* request,
    ::google::protobuf::Empty* response) {

    std::vector<std::string> ackIds(request->ack_ids().begin(), request->ack_ids().end());
    core::Status status = broker_->modifyAckDeadline(request->subscription(), ackIds,
                                                     request->ack_deadline_seconds());
    return new CompletedReactor(toGrpcStatus(status));
}

// =============================================================================
// Pull
// =============================================================================

class PullReactor : public grpc::ServerUnaryReactor {
public:
    PullReactor(std::shared_ptr<core::Broker> broker,
                utils::WorkerPool& workers,
                const pb::PullRequest* request,
                pb::PullResponse* response)
        : broker_(std::move(broker))
        , subscription_(request->subscription())
        , maxMessages_(request->max_messages())
        , returnImmediately_(request->return_immediately())
        , response_(response)
    {
        if (returnImmediately_) {
            run();
            return;
        }

        // Finish() is the worker's last touch of this reactor.
        if (!workers.submit([this]() { run(); })) {
            LOG_WARN("SubscriberService", "Rejecting blocking pull on {}: all {} workers busy",
                     subscription_, workers.maxWorkers());
            Finish(grpc::Status(grpc::StatusCode::UNAVAILABLE,
                                "Too many blocking pull requests in flight"));
        }
    }

    void OnCancel() override {
        LOG_DEBUG("SubscriberService", "Pull on {} cancelled by client", subscription_);
        token_.cancel();
    }

    void OnDone() override {
        delete this;
    }

private:
    void run() {
        std::vector<core::ReceivedMessage> received;
        core::Status status = broker_->pull(subscription_, maxMessages_, returnImmediately_,
                                            received, &token_);

        for (const auto& message : received) {
            toProto(message, response_->add_received_messages());
        }

        LOG_TRACE("SubscriberService", "Pull on {}: {} message(s), status={}",
                  subscription_, received.size(), core::statusCodeToString(status.code()));
        Finish(toGrpcStatus(status));
    }

    std::shared_ptr<core::Broker> broker_;
    const std::string subscription_;
    const int32_t maxMessages_;
    const bool returnImmediately_;
    pb::PullResponse* response_;
    core::CancellationToken token_;
};

grpc::ServerUnaryReactor* SubscriberServiceImpl::Pull(
    grpc::CallbackServerContext* context,
    const pb::PullRequest* request,
    pb::PullResponse* response) {

    return new PullReactor(broker_, pullWorkers_, request, response);
}

}  // namespace services
}  // namespace pubsubd
