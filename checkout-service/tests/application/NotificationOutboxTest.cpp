/**
 * @file NotificationOutboxTest.cpp
 * @brief Unit tests for NotificationOutbox
 */

#include <gtest/gtest.h>
#include "application/NotificationOutbox.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include "../mocks/TestSettings.hpp"
#include <nlohmann/json.hpp>

using namespace checkout;
using namespace checkout::application;
using namespace checkout::tests;

class NotificationOutboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        publisher_ = std::make_shared<MockEventPublisher>();
        settings_ = std::make_shared<TestCheckoutSettings>();
        outbox_ = std::make_shared<NotificationOutbox>(publisher_, settings_);
    }

    std::shared_ptr<MockEventPublisher> publisher_;
    std::shared_ptr<TestCheckoutSettings> settings_;
    std::shared_ptr<NotificationOutbox> outbox_;
};

TEST_F(NotificationOutboxTest, NotifyBuyer_PublishedWithRoutingKey) {
    outbox_->notifyBuyer(42, "Purchase completed");
    outbox_->stop();

    auto messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].routingKey, "buyer.notification");

    auto json = nlohmann::json::parse(messages[0].message);
    EXPECT_EQ(json["buyer_id"], 42);
    EXPECT_EQ(json["text"], "Purchase completed");
    EXPECT_TRUE(json.contains("created_at"));
    EXPECT_EQ(outbox_->delivered(), 1u);
}

TEST_F(NotificationOutboxTest, OperatorAlert_Published) {
    outbox_->raiseOperatorAlert("ASSET_MISMATCH", "pay-1", "paid in eth");
    outbox_->stop();

    auto messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].routingKey, "operator.alert");

    auto json = nlohmann::json::parse(messages[0].message);
    EXPECT_EQ(json["kind"], "ASSET_MISMATCH");
    EXPECT_EQ(json["payment_id"], "pay-1");
}

TEST_F(NotificationOutboxTest, TransientBrokerFailure_Retried) {
    publisher_->failNext(2);

    outbox_->notifyBuyer(1, "hello");
    outbox_->stop();

    EXPECT_EQ(publisher_->publishCallCount(), 3);
    EXPECT_EQ(outbox_->delivered(), 1u);
    EXPECT_EQ(outbox_->failed(), 0u);
}

TEST_F(NotificationOutboxTest, BrokerDown_GivesUpAfterMaxAttempts) {
    publisher_->failNext(3);

    outbox_->notifyBuyer(1, "lost");
    outbox_->notifyBuyer(1, "delivered");
    outbox_->stop();

    EXPECT_EQ(outbox_->failed(), 1u);
    EXPECT_EQ(outbox_->delivered(), 1u);
    ASSERT_EQ(publisher_->getPublishedMessages().size(), 1u);
}

TEST_F(NotificationOutboxTest, AfterStop_MessagesDropped) {
    outbox_->stop();

    outbox_->notifyBuyer(1, "late");

    EXPECT_EQ(outbox_->dropped(), 1u);
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}
