/**
 * @file test_message_log.cpp
 * @brief Unit tests for the per-topic MessageLog
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <pubsubd/core/message_log.hpp>

#include <chrono>
#include <string>

using namespace pubsubd::core;

namespace {

OutgoingMessage makeMessage(const std::string& data) {
    OutgoingMessage msg;
    msg.data = data;
    msg.attributes["origin"] = "test";
    return msg;
}

}  // namespace

class MessageLogTest : public ::testing::Test {
protected:
    std::chrono::system_clock::time_point now_ = std::chrono::system_clock::now();
};

TEST_F(MessageLogTest, EmptyLog) {
    MessageLog log;

    EXPECT_EQ(log.totalAppended(), 0u);
    EXPECT_EQ(log.retainedCount(), 0u);
    EXPECT_EQ(log.retainedBytes(), 0u);
}

TEST_F(MessageLogTest, AssignsSequentialIds) {
    MessageLog log;

    auto a = log.append(makeMessage("a"), now_);
    auto b = log.append(makeMessage("b"), now_);
    auto c = log.append(makeMessage("c"), now_);

    EXPECT_EQ(a->message_id, "1");
    EXPECT_EQ(b->message_id, "2");
    EXPECT_EQ(c->message_id, "3");
    EXPECT_EQ(log.totalAppended(), 3u);
}

TEST_F(MessageLogTest, StoresPayloadAttributesAndTime) {
    MessageLog log;

    auto stored = log.append(makeMessage("payload"), now_);

    EXPECT_EQ(stored->data, "payload");
    EXPECT_EQ(stored->attributes.at("origin"), "test");
    EXPECT_EQ(stored->publish_time, now_);
}

TEST_F(MessageLogTest, IgnoresPublisherSuppliedId) {
    MessageLog log;

    OutgoingMessage msg = makeMessage("x");
    msg.message_id = "mine";
    auto stored = log.append(msg, now_);

    EXPECT_EQ(stored->message_id, "1");
}

TEST_F(MessageLogTest, RetentionWindowEvictsOldest) {
    MessageLog log(2);

    log.append(makeMessage("aa"), now_);
    log.append(makeMessage("bbb"), now_);
    log.append(makeMessage("c"), now_);

    EXPECT_EQ(log.retainedCount(), 2u);
    EXPECT_EQ(log.retainedBytes(), 4u);
    EXPECT_EQ(log.totalAppended(), 3u);
}

TEST_F(MessageLogTest, EvictedMessageOutlivesWindow) {
    MessageLog log(1);

    auto first = log.append(makeMessage("first"), now_);
    log.append(makeMessage("second"), now_);

    // Backlogs and leases keep their own references.
    EXPECT_EQ(first->data, "first");
    EXPECT_EQ(log.retainedCount(), 1u);
}

TEST_F(MessageLogTest, ZeroRetentionKeepsNothing) {
    MessageLog log(0);

    auto stored = log.append(makeMessage("x"), now_);

    EXPECT_EQ(stored->message_id, "1");
    EXPECT_EQ(log.retainedCount(), 0u);
    EXPECT_EQ(log.totalAppended(), 1u);
}
