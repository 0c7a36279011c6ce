/**
 * @file test_broker.cpp
 * @brief Unit tests for the Broker facade
 *
 * Tests cover:
 * - Publish / pull / acknowledge flow
 * - Blocking pull woken by publish
 * - Redelivery after a zero ack deadline
 * - Topic deletion and late subscriptions
 * - Request validation and generated names
 * - Option normalization and push endpoint checks
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <pubsubd/core/broker.hpp>
#include <pubsubd/utils/logger.hpp>

#include <chrono>
#include <atomic>
#include <future>
#include <sstream>
#include <thread>

using namespace pubsubd::core;
using namespace std::chrono_literals;
using ::testing::ElementsAre;
using ::testing::StartsWith;

class BrokerTest : public ::testing::Test {
protected:
    void SetUp() override {
        BrokerOptions options;
        options.pull.max_pull_wait_ms = 3000;
        broker_ = std::make_unique<Broker>(options, nullptr);

        TopicInfo topic;
        ASSERT_TRUE(broker_->createTopic(topic_, topic).ok());
        SubscriptionInfo created;
        ASSERT_TRUE(broker_->createSubscription({subName_, topic_, {}, 0}, created).ok());
    }

    void TearDown() override {
        broker_->stop();
    }

    std::vector<std::string> publish(const std::vector<std::string>& payloads) {
        std::vector<OutgoingMessage> messages;
        for (const auto& payload : payloads) {
            messages.push_back(OutgoingMessage{payload, {}, ""});
        }
        std::vector<std::string> ids;
        Status status = broker_->publish(topic_, messages, ids);
        EXPECT_TRUE(status.ok()) << status.message();
        return ids;
    }

    std::vector<ReceivedMessage> pullNow(int32_t max = 100) {
        std::vector<ReceivedMessage> out;
        Status status = broker_->pull(subName_, max, true, out);
        EXPECT_TRUE(status.ok()) << status.message();
        return out;
    }

    static std::vector<std::string> ackIdsOf(const std::vector<ReceivedMessage>& received) {
        std::vector<std::string> ids;
        for (const auto& r : received) {
            ids.push_back(r.ack_id);
        }
        return ids;
    }

    std::unique_ptr<Broker> broker_;
    const std::string topic_ = "projects/p/topics/orders";
    const std::string subName_ = "projects/p/subscriptions/billing";
};

// =============================================================================
// Delivery flow
// =============================================================================

TEST_F(BrokerTest, PublishPullAcknowledge) {
    auto ids = publish({"a", "b", "c"});
    EXPECT_THAT(ids, ElementsAre("1", "2", "3"));

    auto received = pullNow();
    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(received[0].message->data, "a");
    EXPECT_EQ(received[2].message->message_id, "3");

    ASSERT_TRUE(broker_->acknowledge(subName_, ackIdsOf(received)).ok());
    EXPECT_TRUE(pullNow().empty());

    // Acknowledging again is harmless.
    EXPECT_TRUE(broker_->acknowledge(subName_, ackIdsOf(received)).ok());
}

TEST_F(BrokerTest, FanOutToEverySubscription) {
    SubscriptionInfo second;
    ASSERT_TRUE(broker_->createSubscription(
        {"projects/p/subscriptions/audit", topic_, {}, 0}, second).ok());

    publish({"x"});

    EXPECT_EQ(pullNow().size(), 1u);
    std::vector<ReceivedMessage> out;
    ASSERT_TRUE(broker_->pull("projects/p/subscriptions/audit", 10, true, out).ok());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].message->data, "x");
}

TEST_F(BrokerTest, BlockingPullWokenByPublish) {
    auto pending = std::async(std::launch::async, [this]() {
        std::vector<ReceivedMessage> out;
        Status status = broker_->pull(subName_, 10, false, out);
        return std::make_pair(status, out);
    });

    std::this_thread::sleep_for(50ms);
    publish({"late"});

    ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
    auto [status, out] = pending.get();
    EXPECT_TRUE(status.ok());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].message->data, "late");
}

TEST_F(BrokerTest, ZeroDeadlineRedeliversWithNextAttempt) {
    publish({"retry"});
    auto first = pullNow();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].delivery_attempt, 0);

    ASSERT_TRUE(broker_->modifyAckDeadline(subName_, ackIdsOf(first), 0).ok());
    std::this_thread::sleep_for(5ms);
    EXPECT_EQ(broker_->sweepExpired(), 1u);

    auto second = pullNow();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].message->message_id, first[0].message->message_id);
    EXPECT_EQ(second[0].delivery_attempt, 1);
    EXPECT_NE(second[0].ack_id, first[0].ack_id);

    // The stale ack id no longer matches a lease.
    ASSERT_TRUE(broker_->acknowledge(subName_, ackIdsOf(first)).ok());
    EXPECT_EQ(broker_->registry().findSubscription(subName_)->leaseCount(), 1u);
}

TEST_F(BrokerTest, BackgroundSweeperRedelivers) {
    broker_->start();
    publish({"retry"});
    auto first = pullNow();
    ASSERT_EQ(first.size(), 1u);
    ASSERT_TRUE(broker_->modifyAckDeadline(subName_, ackIdsOf(first), 0).ok());

    std::vector<ReceivedMessage> out;
    ASSERT_TRUE(broker_->pull(subName_, 10, false, out).ok());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].delivery_attempt, 1);
}

TEST_F(BrokerTest, DeleteTopicDetachesSubscription) {
    publish({"kept"});
    ASSERT_TRUE(broker_->deleteTopic(topic_).ok());

    SubscriptionInfo info;
    ASSERT_TRUE(broker_->getSubscription(subName_, info).ok());
    EXPECT_EQ(info.topic, kDeletedTopic);

    std::vector<std::string> ids;
    EXPECT_EQ(broker_->publish(topic_, {OutgoingMessage{"x", {}, ""}}, ids).code(),
              StatusCode::NOT_FOUND);

    // Backlog accumulated before deletion is still deliverable.
    EXPECT_EQ(pullNow().size(), 1u);
}

TEST_F(BrokerTest, LateSubscriptionSeesOnlyNewMessages) {
    publish({"before"});

    SubscriptionInfo late;
    ASSERT_TRUE(broker_->createSubscription(
        {"projects/p/subscriptions/late", topic_, {}, 0}, late).ok());

    std::vector<ReceivedMessage> out;
    ASSERT_TRUE(broker_->pull("projects/p/subscriptions/late", 10, true, out).ok());
    EXPECT_TRUE(out.empty());

    publish({"after"});
    ASSERT_TRUE(broker_->pull("projects/p/subscriptions/late", 10, true, out).ok());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].message->data, "after");
}

TEST_F(BrokerTest, DeletedSubscriptionIsGone) {
    publish({"a"});
    ASSERT_TRUE(broker_->deleteSubscription(subName_).ok());
    ASSERT_TRUE(broker_->deleteSubscription(subName_).ok());

    std::vector<ReceivedMessage> out;
    EXPECT_EQ(broker_->pull(subName_, 10, true, out).code(), StatusCode::NOT_FOUND);
    EXPECT_EQ(broker_->acknowledge(subName_, {"x"}).code(), StatusCode::NOT_FOUND);
    EXPECT_EQ(broker_->modifyAckDeadline(subName_, {"x"}, 10).code(), StatusCode::NOT_FOUND);

    SubscriptionInfo info;
    EXPECT_EQ(broker_->getSubscription(subName_, info).code(), StatusCode::NOT_FOUND);
}

// =============================================================================
// Validation and normalization
// =============================================================================

TEST_F(BrokerTest, PublishValidation) {
    std::vector<std::string> ids;
    EXPECT_EQ(broker_->publish(topic_, {}, ids).code(), StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(broker_->publish(topic_, {OutgoingMessage{"x", {}, "42"}}, ids).code(),
              StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(broker_->publish("projects/p/topics/none", {OutgoingMessage{"x", {}, ""}}, ids).code(),
              StatusCode::NOT_FOUND);
}

TEST_F(BrokerTest, PullValidation) {
    std::vector<ReceivedMessage> out;
    EXPECT_EQ(broker_->pull(subName_, 0, true, out).code(), StatusCode::INVALID_ARGUMENT);
}

TEST_F(BrokerTest, AckDeadlineNormalization) {
    SubscriptionInfo info;
    ASSERT_TRUE(broker_->getSubscription(subName_, info).ok());
    EXPECT_EQ(info.ack_deadline_seconds, 60);

    SubscriptionInfo clamped;
    ASSERT_TRUE(broker_->createSubscription(
        {"projects/p/subscriptions/long", topic_, {}, 5000}, clamped).ok());
    EXPECT_EQ(clamped.ack_deadline_seconds, 600);

    SubscriptionInfo rejected;
    EXPECT_EQ(broker_->createSubscription(
        {"projects/p/subscriptions/neg", topic_, {}, -1}, rejected).code(),
        StatusCode::INVALID_ARGUMENT);

    EXPECT_EQ(broker_->modifyAckDeadline(subName_, {}, -1).code(), StatusCode::INVALID_ARGUMENT);
}

TEST_F(BrokerTest, GeneratedSubscriptionName) {
    SubscriptionInfo created;
    ASSERT_TRUE(broker_->createSubscription({"", topic_, {}, 0}, created).ok());

    EXPECT_THAT(created.name, StartsWith("projects/p/subscriptions/"));
    EXPECT_GT(created.name.size(), std::string("projects/p/subscriptions/").size());

    SubscriptionInfo fetched;
    EXPECT_TRUE(broker_->getSubscription(created.name, fetched).ok());
}

TEST_F(BrokerTest, CreateSubscriptionErrors) {
    SubscriptionInfo out;
    EXPECT_EQ(broker_->createSubscription({subName_, topic_, {}, 0}, out).code(),
              StatusCode::ALREADY_EXISTS);
    EXPECT_EQ(broker_->createSubscription(
        {"projects/p/subscriptions/x", "projects/p/topics/none", {}, 0}, out).code(),
        StatusCode::NOT_FOUND);
}

TEST_F(BrokerTest, ModifyPushConfigWithoutTransport) {
    PushConfig config;
    config.push_endpoint = "http://localhost:1/push";
    ASSERT_TRUE(broker_->modifyPushConfig(subName_, config).ok());

    SubscriptionInfo info;
    ASSERT_TRUE(broker_->getSubscription(subName_, info).ok());
    EXPECT_EQ(info.push_config.push_endpoint, "http://localhost:1/push");
    EXPECT_EQ(broker_->pushDispatcher(), nullptr);

    EXPECT_EQ(broker_->modifyPushConfig("projects/p/subscriptions/none", config).code(),
              StatusCode::NOT_FOUND);
}

TEST_F(BrokerTest, ListingsThroughBroker) {
    ListPage<std::string> names;
    ASSERT_TRUE(broker_->listTopicSubscriptions(topic_, 0, "", names).ok());
    EXPECT_THAT(names.items, ElementsAre(subName_));

    ListPage<TopicInfo> topics;
    ASSERT_TRUE(broker_->listTopics("projects/p", 0, "", topics).ok());
    ASSERT_EQ(topics.items.size(), 1u);

    ListPage<SubscriptionInfo> subs;
    ASSERT_TRUE(broker_->listSubscriptions("projects/q", 0, "", subs).ok());
    EXPECT_TRUE(subs.items.empty());
}

TEST_F(BrokerTest, LogStatsReportsCounters) {
    publish({"a", "b"});

    std::ostringstream output;
    auto& logger = pubsubd::utils::Logger::instance();
    logger.setLevel(pubsubd::utils::LogLevel::INFO);
    logger.setColorEnabled(false);
    logger.setStream(&output);
    broker_->logStats();
    logger.setStream(nullptr);
    logger.setColorEnabled(true);

    std::string text = output.str();
    EXPECT_NE(text.find("Topic projects/p/topics/orders: published=2"), std::string::npos);
    EXPECT_NE(text.find("Subscription projects/p/subscriptions/billing: backlog=2"), std::string::npos);
}

// =============================================================================
// Push delivery through the broker
// =============================================================================

namespace {

class AcceptingTransport : public PushTransport {
public:
    bool deliver(const PushRequest&) override {
        delivered++;
        return true;
    }
    std::atomic<int> delivered{0};
};

// Only reaches endpoints on the "http://ok" host.
class PickyTransport : public AcceptingTransport {
public:
    bool supportsEndpoint(const std::string& endpoint) const override {
        return endpoint.rfind("http://ok/", 0) == 0;
    }
};

}  // namespace

TEST(BrokerPushTest, PushSubscriptionIsDelivered) {
    auto transport = std::make_shared<AcceptingTransport>();
    BrokerOptions options;
    options.push.idle_wait_ms = 20;
    Broker broker(options, transport);

    TopicInfo topic;
    ASSERT_TRUE(broker.createTopic("projects/p/topics/t", topic).ok());

    SubscriptionInfo request;
    request.name = "projects/p/subscriptions/push";
    request.topic = "projects/p/topics/t";
    request.push_config.push_endpoint = "http://localhost:1/push";
    SubscriptionInfo created;
    ASSERT_TRUE(broker.createSubscription(request, created).ok());
    ASSERT_NE(broker.pushDispatcher(), nullptr);
    EXPECT_EQ(broker.pushDispatcher()->activeLoops(), 1u);

    std::vector<std::string> ids;
    ASSERT_TRUE(broker.publish("projects/p/topics/t", {OutgoingMessage{"p", {}, ""}}, ids).ok());

    for (int i = 0; i < 400 && transport->delivered.load() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(transport->delivered.load(), 1);

    broker.stop();
    EXPECT_EQ(broker.pushDispatcher()->activeLoops(), 0u);
}

TEST(BrokerPushTest, UnsupportedEndpointRejected) {
    auto transport = std::make_shared<PickyTransport>();
    Broker broker(BrokerOptions{}, transport);

    TopicInfo topic;
    ASSERT_TRUE(broker.createTopic("projects/p/topics/t", topic).ok());

    SubscriptionInfo request;
    request.name = "projects/p/subscriptions/push";
    request.topic = "projects/p/topics/t";
    request.push_config.push_endpoint = "https://elsewhere/push";
    SubscriptionInfo created;
    EXPECT_EQ(broker.createSubscription(request, created).code(), StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(broker.getSubscription(request.name, created).code(), StatusCode::NOT_FOUND);

    request.push_config = PushConfig{};
    ASSERT_TRUE(broker.createSubscription(request, created).ok());

    PushConfig bad;
    bad.push_endpoint = "https://elsewhere/push";
    EXPECT_EQ(broker.modifyPushConfig(request.name, bad).code(), StatusCode::INVALID_ARGUMENT);
    ASSERT_TRUE(broker.getSubscription(request.name, created).ok());
    EXPECT_TRUE(created.push_config.empty());
    EXPECT_EQ(broker.pushDispatcher()->activeLoops(), 0u);

    PushConfig good;
    good.push_endpoint = "http://ok/push";
    EXPECT_TRUE(broker.modifyPushConfig(request.name, good).ok());
    EXPECT_EQ(broker.pushDispatcher()->activeLoops(), 1u);

    broker.stop();
}

TEST(BrokerPushTest, DeletedPushSubscriptionIsReleased) {
    auto transport = std::make_shared<AcceptingTransport>();
    BrokerOptions options;
    options.push.idle_wait_ms = 20;
    Broker broker(options, transport);

    TopicInfo topic;
    ASSERT_TRUE(broker.createTopic("projects/p/topics/t", topic).ok());
    SubscriptionInfo request;
    request.name = "projects/p/subscriptions/push";
    request.topic = "projects/p/topics/t";
    request.push_config.push_endpoint = "http://localhost:1/push";
    SubscriptionInfo created;
    ASSERT_TRUE(broker.createSubscription(request, created).ok());

    std::weak_ptr<Subscription> weak = broker.registry().findSubscription(request.name);
    ASSERT_FALSE(weak.expired());

    ASSERT_TRUE(broker.deleteSubscription(request.name).ok());
    for (int i = 0; i < 400 && !weak.expired(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(weak.expired());

    broker.pushDispatcher()->reapFinished();
    EXPECT_EQ(broker.pushDispatcher()->activeLoops(), 0u);
    broker.stop();
}

TEST(BrokerOptionsTest, NonPositiveOptionsAreNormalized) {
    BrokerOptions options;
    options.default_ack_deadline_seconds = 0;
    options.max_ack_deadline_seconds = -5;
    options.sweep_interval_ms = 0;
    options.pull.max_messages_per_pull = 0;
    options.pull.max_outstanding_pulls = 0;
    options.pull.max_pull_wait_ms = 200;
    Broker broker(options, nullptr);

    EXPECT_EQ(broker.options().max_ack_deadline_seconds, 1);
    EXPECT_EQ(broker.options().default_ack_deadline_seconds, 1);
    EXPECT_EQ(broker.options().sweep_interval_ms, 1);

    TopicInfo topic;
    ASSERT_TRUE(broker.createTopic("projects/p/topics/t", topic).ok());
    SubscriptionInfo created;
    ASSERT_TRUE(broker.createSubscription({"projects/p/subscriptions/s", "projects/p/topics/t", {}, 0},
                                          created).ok());
    EXPECT_EQ(created.ack_deadline_seconds, 1);

    std::vector<std::string> ids;
    ASSERT_TRUE(broker.publish("projects/p/topics/t",
                               {OutgoingMessage{"a", {}, ""}, OutgoingMessage{"b", {}, ""}}, ids).ok());

    // A blocking pull with a backlog returns at once instead of spinning.
    auto start = std::chrono::steady_clock::now();
    std::vector<ReceivedMessage> out;
    ASSERT_TRUE(broker.pull("projects/p/subscriptions/s", 10, false, out).ok());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 150ms);
    EXPECT_EQ(out.size(), 1u);

    broker.stop();
}
