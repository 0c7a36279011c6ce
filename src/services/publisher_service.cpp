/**
 * @file publisher_service.cpp
 * @brief PublisherServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/services/publisher_service.hpp"
#include "pubsubd/services/completed_reactor.hpp"
#include "pubsubd/services/proto_convert.hpp"
#include "pubsubd/utils/logger.hpp"

#include <vector>

namespace pubsubd {
namespace services {

PublisherServiceImpl::PublisherServiceImpl(std::shared_ptr<core::Broker> broker)
    : broker_(std::move(broker))
{
    LOG_DEBUG("PublisherService", "Service created");
}

PublisherServiceImpl::~PublisherServiceImpl() = default;

// =============================================================================
// CreateTopic / GetTopic / DeleteTopic
// =============================================================================

grpc::ServerUnaryReactor* PublisherServiceImpl::CreateTopic(
    grpc::CallbackServerContext* context,
    const pb::Topic* request,
    pb::Topic* response) {

    core::TopicInfo topic;
    core::Status status = broker_->createTopic(request->name(), topic);
    if (status.ok()) {
        response->set_name(topic.name);
    }
    return new CompletedReactor(toGrpcStatus(status));
}

grpc::ServerUnaryReactor* PublisherServiceImpl::GetTopic(
    grpc::CallbackServerContext* context,
    const pb::GetTopicRequest* request,
    pb::Topic* response) {

    core::TopicInfo topic;
    core::Status status = broker_->getTopic(request->topic(), topic);
    if (status.ok()) {
        response->set_name(topic.name);
    }
    return new CompletedReactor(toGrpcStatus(status));
}

grpc::ServerUnaryReactor* PublisherServiceImpl::DeleteTopic(
    grpc::CallbackServerContext* context,
    const pb::DeleteTopicRequest* request,
    ::google::protobuf::Empty* response) {

    return new CompletedReactor(toGrpcStatus(broker_->deleteTopic(request->topic())));
}

// =============================================================================
// Listings
// =============================================================================

grpc::ServerUnaryReactor* PublisherServiceImpl::ListTopics(
    grpc::CallbackServerContext* context,
    const pb::ListTopicsRequest* request,
    pb::ListTopicsResponse* response) {

    core::ListPage<core::TopicInfo> page;
    core::Status status = broker_->listTopics(request->project(), request->page_size(),
                                              request->page_token(), page);
    if (status.ok()) {
        for (const auto& topic : page.items) {
            response->add_topics()->set_name(topic.name);
        }
        response->set_next_page_token(page.next_page_token);
    }
    return new CompletedReactor(toGrpcStatus(status));
}

grpc::ServerUnaryReactor* PublisherServiceImpl::ListTopicSubscriptions(
    grpc::CallbackServerContext* context,
    const pb::ListTopicSubscriptionsRequest* request,
    pb::ListTopicSubscriptionsResponse* response) {

    core::ListPage<std::string> page;
    core::Status status = broker_->listTopicSubscriptions(request->topic(), request->page_size(),
                                                          request->page_token(), page);
    if (status.ok()) {
        for (const auto& name : page.items) {
            response->add_subscriptions(name);
        }
        response->set_next_page_token(page.next_page_token);
    }
    return new CompletedReactor(toGrpcStatus(status));
}

// =============================================================================
// Publish
// =============================================================================

class PublishReactor : public grpc::ServerUnaryReactor {
public:
    PublishReactor(core::Broker& broker,
                   const pb::PublishRequest* request,
                   pb::PublishResponse* response)
    {
        std::vector<core::OutgoingMessage> messages;
        messages.reserve(request->messages_size());
        for (const auto& message : request->messages()) {
            messages.push_back(fromProto(message));
        }

        std::vector<std::string> ids;
        core::Status status = broker.publish(request->topic(), messages, ids);
        if (status.ok()) {
            for (const auto& id : ids) {
                response->add_message_ids(id);
            }
        } else {
            LOG_DEBUG("PublisherService", "Publish to {} rejected: {}",
                      request->topic(), status.message());
        }

        Finish(toGrpcStatus(status));
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* PublisherServiceImpl::Publish(
    grpc::CallbackServerContext* context,
    const pb::PublishRequest* request,
    pb::PublishResponse* response) {

    return new PublishReactor(*broker_, request, response);
}

}  // namespace services
}  // namespace pubsubd
