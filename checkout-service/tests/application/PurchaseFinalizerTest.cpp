/**
 * @file PurchaseFinalizerTest.cpp
 * @brief Unit tests for PurchaseFinalizer
 */

#include <gtest/gtest.h>
#include "application/PurchaseFinalizer.hpp"
#include "../mocks/InMemoryStore.hpp"
#include "../mocks/FakeClock.hpp"

using namespace checkout;
using namespace checkout::application;
using namespace checkout::tests;

class PurchaseFinalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryStore>();
        clock_ = std::make_shared<FakeClock>();
        finalizer_ = std::make_shared<PurchaseFinalizer>(store_, store_, clock_);

        ringId_ = store_->addProduct("paris", "ring", "gold", "50", 3);
        watchId_ = store_->addProduct("berlin", "watch", "black", "40", 1);
        chainId_ = store_->addProduct("rome", "chain", "silver", "30", 2);
    }

    /// Зарезервировать единицу и вернуть её как позицию снимка
    domain::SnapshotItem reserve(int64_t buyerId, const std::string& category,
                                 const std::string& variant, const std::string& price) {
        domain::ProductSelector s;
        s.category = category;
        s.variant = variant;
        s.price = domain::Money::parse(price, "eur");
        auto entry = store_->reserveUnit(buyerId, s, clock_->now());
        EXPECT_TRUE(entry.has_value());

        domain::SnapshotItem item;
        item.productId = entry->productId;
        item.name = entry->name;
        item.category = entry->category;
        item.variant = entry->variant;
        item.location = entry->location;
        item.catalogPrice = entry->reservedPrice;
        item.discountedPrice = entry->reservedPrice;
        return item;
    }

    std::shared_ptr<InMemoryStore> store_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<PurchaseFinalizer> finalizer_;
    int64_t ringId_ = 0;
    int64_t watchId_ = 0;
    int64_t chainId_ = 0;
};

// ============================================================================
// SUCCESS
// ============================================================================

TEST_F(PurchaseFinalizerTest, Finalize_ConsumesReservationsAndRecordsPurchases) {
    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));
    snapshot.items.push_back(reserve(1, "watch", "black", "40"));

    auto result = finalizer_->finalize(1, snapshot, std::nullopt, std::nullopt, std::nullopt);

    EXPECT_EQ(result.status, domain::FinalizeStatus::SUCCESS);
    EXPECT_EQ(result.itemCount, 2);
    EXPECT_EQ(result.totalPaid.toString(), "90.00");
    EXPECT_EQ(store_->product(ringId_).available, 2);
    EXPECT_EQ(store_->product(ringId_).reserved, 0);
    EXPECT_EQ(store_->product(watchId_).available, 0);
    EXPECT_EQ(store_->entryCount(1), 0);
    EXPECT_EQ(store_->purchaseCount(1), 2);
}

TEST_F(PurchaseFinalizerTest, Finalize_AppliesResellerPercentPerCategory) {
    store_->setResellerPercent(1, "ring", 20);
    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));
    snapshot.items.push_back(reserve(1, "chain", "silver", "30"));

    auto result = finalizer_->finalize(1, snapshot, std::nullopt, std::nullopt, std::nullopt);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.totalPaid.toString(), "70.00");

    auto history = store_->history(1, 10);
    ASSERT_EQ(history.size(), 2u);
    // новые записи первыми
    EXPECT_EQ(history[0].productId, chainId_);
    EXPECT_EQ(history[0].pricePaid.toString(), "30.00");
    EXPECT_EQ(history[1].pricePaid.toString(), "40.00");
}

TEST_F(PurchaseFinalizerTest, Finalize_IncrementsDiscountCodeUses) {
    domain::DiscountCode code;
    code.code = "SAVE10";
    code.value = domain::Money(10, 0, "%");
    store_->addDiscountCode(code);

    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));

    auto result = finalizer_->finalize(1, snapshot, std::string("SAVE10"), std::nullopt, std::nullopt);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(store_->usesOf("SAVE10"), 1);
}

TEST_F(PurchaseFinalizerTest, Finalize_SettledPayment_CountsCodeEvenIfUsedUp) {
    domain::DiscountCode code;
    code.code = "ONCE";
    code.value = domain::Money(10, 0, "%");
    code.maxUses = 1;
    code.usesCount = 1;
    store_->addDiscountCode(code);

    domain::PendingSettlement pending;
    pending.paymentId = "pay-9";
    pending.buyerId = 1;
    pending.isPurchase = true;
    store_->save(pending);

    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));

    auto result = finalizer_->finalize(1, snapshot, std::string("ONCE"), std::string("pay-9"), std::nullopt);

    // оплата уже получена по цене со скидкой
    ASSERT_TRUE(result.success());
    EXPECT_EQ(store_->usesOf("ONCE"), 2);
}

TEST_F(PurchaseFinalizerTest, Finalize_ReturnsPickupTextPerProduct) {
    auto pendantId = store_->addProduct("paris", "pendant", "silver", "20", 2,
                                        "Silver pendant", "Locker 12, code 4471");
    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "pendant", "silver", "20"));
    snapshot.items.push_back(reserve(1, "pendant", "silver", "20"));
    snapshot.items.push_back(reserve(1, "chain", "silver", "30"));

    auto result = finalizer_->finalize(1, snapshot, std::nullopt, std::nullopt, std::nullopt);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.itemCount, 3);
    ASSERT_EQ(result.pickups.size(), 2u);
    EXPECT_EQ(result.pickups[0].productId, pendantId);
    EXPECT_EQ(result.pickups[0].text, "Locker 12, code 4471");
    EXPECT_EQ(result.pickups[1].productId, chainId_);
    EXPECT_TRUE(result.pickups[1].text.empty());

    auto notice = PurchaseFinalizer::deliveryNotice("Done.", result);
    EXPECT_NE(notice.find("--- Item: Silver pendant silver ---\nLocker 12, code 4471"), std::string::npos);
    EXPECT_NE(notice.find("(No specific pickup details provided)"), std::string::npos);
}

TEST_F(PurchaseFinalizerTest, Finalize_DebitsBalance) {
    store_->setBalance(1, "100");
    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));

    auto result = finalizer_->finalize(1, snapshot, std::nullopt, std::nullopt,
                                       domain::Money::parse("45", "eur"));

    ASSERT_TRUE(result.success());
    EXPECT_EQ(store_->getBalance(1).toString(), "55.00");
}

TEST_F(PurchaseFinalizerTest, Finalize_ExpiredReservation_UsesFreeUnit) {
    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));
    store_->releaseExpired(clock_->now());

    auto result = finalizer_->finalize(1, snapshot, std::nullopt, std::nullopt, std::nullopt);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(store_->product(ringId_).available, 2);
    EXPECT_EQ(store_->product(ringId_).reserved, 0);
}

// ============================================================================
// FAILURES: nothing partially applied
// ============================================================================

TEST_F(PurchaseFinalizerTest, Finalize_InsufficientBalance_NothingChanges) {
    store_->setBalance(1, "10");
    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));

    auto result = finalizer_->finalize(1, snapshot, std::nullopt, std::nullopt,
                                       domain::Money::parse("50", "eur"));

    EXPECT_EQ(result.status, domain::FinalizeStatus::INSUFFICIENT_BALANCE);
    EXPECT_EQ(store_->getBalance(1).toString(), "10.00");
    EXPECT_EQ(store_->entryCount(1), 1);
    EXPECT_EQ(store_->product(ringId_).reserved, 1);
    EXPECT_EQ(store_->purchaseCount(1), 0);
}

TEST_F(PurchaseFinalizerTest, Finalize_BalancePayment_CodeUsedUp_NothingChanges) {
    store_->setBalance(1, "100");
    domain::DiscountCode code;
    code.code = "ONCE";
    code.value = domain::Money(10, 0, "%");
    code.maxUses = 1;
    code.usesCount = 1;
    store_->addDiscountCode(code);

    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));

    auto result = finalizer_->finalize(1, snapshot, std::string("ONCE"), std::nullopt,
                                       domain::Money::parse("45", "eur"));

    EXPECT_EQ(result.status, domain::FinalizeStatus::DISCOUNT_REJECTED);
    EXPECT_EQ(result.itemCount, 0);
    EXPECT_TRUE(result.pickups.empty());
    EXPECT_EQ(store_->usesOf("ONCE"), 1);
    EXPECT_EQ(store_->getBalance(1).toString(), "100.00");
    EXPECT_EQ(store_->entryCount(1), 1);
    EXPECT_EQ(store_->product(ringId_).reserved, 1);
    EXPECT_EQ(store_->purchaseCount(1), 0);
}

TEST_F(PurchaseFinalizerTest, Finalize_BalancePayment_CodeExpired_Rejected) {
    store_->setBalance(1, "100");
    domain::DiscountCode code;
    code.code = "SPRING";
    code.value = domain::Money(10, 0, "%");
    code.expiresAt = clock_->now();
    store_->addDiscountCode(code);

    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));

    auto result = finalizer_->finalize(1, snapshot, std::string("SPRING"), std::nullopt,
                                       domain::Money::parse("45", "eur"));

    EXPECT_EQ(result.status, domain::FinalizeStatus::DISCOUNT_REJECTED);
    EXPECT_EQ(store_->usesOf("SPRING"), 0);
}

TEST_F(PurchaseFinalizerTest, Finalize_SecondOfThreeUnavailable_RollsBackAll) {
    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));
    snapshot.items.push_back(reserve(1, "watch", "black", "40"));
    snapshot.items.push_back(reserve(1, "chain", "silver", "30"));

    // резерв часов снят, а последнюю единицу забрал другой покупатель
    store_->releaseEntry(1, watchId_);
    domain::ProductSelector other;
    other.category = "watch";
    other.variant = "black";
    other.price = domain::Money::parse("40", "eur");
    ASSERT_TRUE(store_->reserveUnit(2, other, clock_->now()).has_value());

    auto result = finalizer_->finalize(1, snapshot, std::nullopt, std::nullopt, std::nullopt);

    EXPECT_EQ(result.status, domain::FinalizeStatus::UNIT_UNAVAILABLE);
    EXPECT_EQ(result.failedProductId, watchId_);
    EXPECT_EQ(store_->purchaseCount(1), 0);
    EXPECT_EQ(store_->product(ringId_).available, 3);
    EXPECT_EQ(store_->product(ringId_).reserved, 1);
    EXPECT_EQ(store_->product(chainId_).reserved, 1);
    EXPECT_EQ(store_->entryCount(1), 2);
}

TEST_F(PurchaseFinalizerTest, Finalize_ErrorMidTransaction_RollsBackAll) {
    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));
    snapshot.items.push_back(reserve(1, "chain", "silver", "30"));
    store_->failCommitAfterLines(1);

    auto result = finalizer_->finalize(1, snapshot, std::nullopt, std::nullopt, std::nullopt);

    EXPECT_EQ(result.status, domain::FinalizeStatus::FAILED);
    EXPECT_EQ(store_->purchaseCount(1), 0);
    EXPECT_EQ(store_->product(ringId_).available, 3);
    EXPECT_EQ(store_->entryCount(1), 2);
}

TEST_F(PurchaseFinalizerTest, Finalize_EmptySnapshot_Failed) {
    auto result = finalizer_->finalize(1, domain::BasketSnapshot{}, std::nullopt, std::nullopt, std::nullopt);

    EXPECT_EQ(result.status, domain::FinalizeStatus::FAILED);
}

TEST_F(PurchaseFinalizerTest, Finalize_SettlementAlreadyClosed_AlreadySettled) {
    domain::BasketSnapshot snapshot;
    snapshot.items.push_back(reserve(1, "ring", "gold", "50"));

    auto result = finalizer_->finalize(1, snapshot, std::nullopt, std::string("pay-404"), std::nullopt);

    EXPECT_EQ(result.status, domain::FinalizeStatus::ALREADY_SETTLED);
    EXPECT_EQ(store_->entryCount(1), 1);
}
