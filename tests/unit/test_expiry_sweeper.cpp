/**
 * @file test_expiry_sweeper.cpp
 * @brief Unit tests for ExpirySweeper
 */

#include <gtest/gtest.h>
#include <pubsubd/core/expiry_sweeper.hpp>

#include <chrono>
#include <thread>

using namespace pubsubd::core;
using namespace std::chrono_literals;

class ExpirySweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<Registry>();
        TopicInfo info;
        ASSERT_TRUE(registry_->createTopic("projects/p/topics/t", info).ok());
        ASSERT_TRUE(registry_->createSubscription(
            {"projects/p/subscriptions/a", "projects/p/topics/t", {}, 10}, subA_).ok());
        ASSERT_TRUE(registry_->createSubscription(
            {"projects/p/subscriptions/b", "projects/p/topics/t", {}, 10}, subB_).ok());
    }

    static MessagePtr makeMessage(const std::string& id) {
        auto message = std::make_shared<Message>();
        message->message_id = id;
        return message;
    }

    std::shared_ptr<Registry> registry_;
    std::shared_ptr<Subscription> subA_;
    std::shared_ptr<Subscription> subB_;
};

TEST_F(ExpirySweeperTest, SweepOnceRequeuesAcrossSubscriptions) {
    auto now = Subscription::Clock::now();
    subA_->enqueue(makeMessage("1"));
    subA_->enqueue(makeMessage("2"));
    subB_->enqueue(makeMessage("1"));
    subA_->leaseBatch(10, now);
    subB_->leaseBatch(10, now);

    ExpirySweeper sweeper(registry_, 1000ms);

    EXPECT_EQ(sweeper.sweepOnce(now + 5s), 0u);
    EXPECT_EQ(sweeper.sweepOnce(now + 11s), 3u);
    EXPECT_EQ(sweeper.totalRequeued(), 3u);

    EXPECT_EQ(subA_->backlogSize(), 2u);
    EXPECT_EQ(subB_->backlogSize(), 1u);
    EXPECT_EQ(subA_->leaseCount(), 0u);
}

TEST_F(ExpirySweeperTest, RequeuedMessageCarriesNextAttempt) {
    auto now = Subscription::Clock::now();
    subA_->enqueue(makeMessage("1"));
    subA_->leaseBatch(1, now);

    ExpirySweeper sweeper(registry_, 1000ms);
    sweeper.sweepOnce(now + 11s);

    auto batch = subA_->leaseBatch(1, now + 11s);
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].delivery_attempt, 1);
}

TEST_F(ExpirySweeperTest, StartStop) {
    ExpirySweeper sweeper(registry_, 20ms);

    EXPECT_TRUE(sweeper.start());
    EXPECT_FALSE(sweeper.start());
    EXPECT_TRUE(sweeper.isRunning());

    sweeper.stop();
    EXPECT_FALSE(sweeper.isRunning());
    sweeper.stop();
}

TEST_F(ExpirySweeperTest, StopIsPrompt) {
    ExpirySweeper sweeper(registry_, 60000ms);
    ASSERT_TRUE(sweeper.start());

    auto start = std::chrono::steady_clock::now();
    sweeper.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST_F(ExpirySweeperTest, BackgroundThreadRedeliversExpiredLease) {
    subA_->enqueue(makeMessage("1"));
    auto batch = subA_->leaseBatch(1, Subscription::Clock::now());
    ASSERT_EQ(batch.size(), 1u);
    subA_->modifyAckDeadline({batch[0].ack_id}, 0s, Subscription::Clock::now());

    ExpirySweeper sweeper(registry_, 10ms);
    ASSERT_TRUE(sweeper.start());

    for (int i = 0; i < 200 && subA_->backlogSize() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    sweeper.stop();

    EXPECT_EQ(subA_->backlogSize(), 1u);
    EXPECT_EQ(subA_->leaseCount(), 0u);
    EXPECT_GE(sweeper.totalRequeued(), 1u);
}

TEST_F(ExpirySweeperTest, IgnoresDeletedSubscriptions) {
    auto now = Subscription::Clock::now();
    subA_->enqueue(makeMessage("1"));
    subA_->leaseBatch(1, now);
    registry_->deleteSubscription("projects/p/subscriptions/a");

    ExpirySweeper sweeper(registry_, 1000ms);
    EXPECT_EQ(sweeper.sweepOnce(now + 11s), 0u);
    EXPECT_EQ(subA_->backlogSize(), 0u);
}
