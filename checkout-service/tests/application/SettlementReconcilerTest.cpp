/**
 * @file SettlementReconcilerTest.cpp
 * @brief Unit tests for SettlementReconciler
 */

#include <gtest/gtest.h>
#include "application/SettlementReconciler.hpp"
#include "../mocks/InMemoryStore.hpp"
#include "../mocks/FakeClock.hpp"
#include "../mocks/RecordingOutbox.hpp"
#include "../mocks/TestSettings.hpp"
#include <tuple>

using namespace checkout;
using namespace checkout::application;
using namespace checkout::tests;

class SettlementReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryStore>();
        clock_ = std::make_shared<FakeClock>();
        outbox_ = std::make_shared<RecordingOutbox>();
        settings_ = std::make_shared<TestCheckoutSettings>();
        finalizer_ = std::make_shared<PurchaseFinalizer>(store_, store_, clock_);

        reconciler_ = std::make_shared<SettlementReconciler>(store_, store_, finalizer_, outbox_, settings_);

        ringId_ = store_->addProduct("paris", "ring", "gold", "50", 2, "Gold ring", "Locker 7, code 1290");
        watchId_ = store_->addProduct("berlin", "watch", "black", "40", 1);
    }

    /// Зарезервировать товары покупателя 5 и открыть под них платёж
    void openPurchase(const std::string& paymentId, const std::string& expectedBtc) {
        domain::PendingSettlement p;
        p.paymentId = paymentId;
        p.buyerId = 5;
        p.settlementAsset = "btc";
        p.isPurchase = true;
        p.expectedAssetAmount = domain::Money::parse(expectedBtc, "btc");
        p.targetAmount = domain::Money::parse("90", "eur");
        p.createdAt = clock_->now();

        for (auto [category, variant, price] : {std::tuple{"ring", "gold", "50"},
                                                std::tuple{"watch", "black", "40"}}) {
            domain::ProductSelector s;
            s.category = category;
            s.variant = variant;
            s.price = domain::Money::parse(price, "eur");
            auto entry = store_->reserveUnit(5, s, clock_->now());
            ASSERT_TRUE(entry.has_value());

            domain::SnapshotItem item;
            item.productId = entry->productId;
            item.name = entry->name;
            item.category = entry->category;
            item.variant = entry->variant;
            item.location = entry->location;
            item.catalogPrice = entry->reservedPrice;
            item.discountedPrice = entry->reservedPrice;
            p.snapshot.items.push_back(item);
        }
        store_->save(p);
    }

    void openTopUp(const std::string& paymentId, const std::string& targetEur, const std::string& expectedBtc) {
        domain::PendingSettlement p;
        p.paymentId = paymentId;
        p.buyerId = 5;
        p.settlementAsset = "btc";
        p.isPurchase = false;
        p.expectedAssetAmount = domain::Money::parse(expectedBtc, "btc");
        p.targetAmount = domain::Money::parse(targetEur, "eur");
        p.createdAt = clock_->now();
        store_->save(p);
    }

    static domain::SettlementNotification ipn(const std::string& paymentId,
                                              const std::string& status,
                                              const std::string& paid,
                                              const std::string& currency = "btc") {
        domain::SettlementNotification n;
        n.paymentId = paymentId;
        n.paymentStatus = status;
        n.payCurrency = currency;
        n.actuallyPaid = domain::Money::parse(paid, currency);
        return n;
    }

    std::shared_ptr<InMemoryStore> store_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<RecordingOutbox> outbox_;
    std::shared_ptr<TestCheckoutSettings> settings_;
    std::shared_ptr<PurchaseFinalizer> finalizer_;
    std::shared_ptr<SettlementReconciler> reconciler_;
    int64_t ringId_ = 0;
    int64_t watchId_ = 0;
};

// ============================================================================
// PURCHASE
// ============================================================================

TEST_F(SettlementReconcilerTest, Finished_FinalizesPurchase) {
    openPurchase("pay-1", "0.002");

    auto result = reconciler_->reconcile(ipn("pay-1", "finished", "0.002"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::FINALIZED);
    EXPECT_FALSE(store_->hasPending("pay-1"));
    EXPECT_EQ(store_->purchaseCount(5), 2);
    EXPECT_EQ(store_->product(ringId_).available, 1);
    EXPECT_EQ(store_->entryCount(5), 0);
    EXPECT_EQ(outbox_->notices().size(), 1u);
}

TEST_F(SettlementReconcilerTest, Finished_NoticeCarriesPickupDetails) {
    openPurchase("pay-1", "0.002");

    reconciler_->reconcile(ipn("pay-1", "finished", "0.002"));

    auto notices = outbox_->notices();
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].buyerId, 5);
    EXPECT_NE(notices[0].text.find("pay-1 confirmed"), std::string::npos);
    EXPECT_NE(notices[0].text.find("--- Item: Gold ring gold ---\nLocker 7, code 1290"), std::string::npos);
    EXPECT_NE(notices[0].text.find("(No specific pickup details provided)"), std::string::npos);
}

TEST_F(SettlementReconcilerTest, DoubleDelivery_SecondIsUnknownPayment) {
    openPurchase("pay-1", "0.002");

    auto first = reconciler_->reconcile(ipn("pay-1", "finished", "0.002"));
    auto second = reconciler_->reconcile(ipn("pay-1", "finished", "0.002"));

    EXPECT_EQ(first.outcome, domain::ReconcileOutcome::FINALIZED);
    EXPECT_EQ(second.outcome, domain::ReconcileOutcome::UNKNOWN_PAYMENT);
    EXPECT_EQ(store_->purchaseCount(5), 2);
    EXPECT_EQ(store_->product(ringId_).available, 1);
}

TEST_F(SettlementReconcilerTest, PartiallyPaidInFull_Finalizes) {
    openPurchase("pay-1", "0.002");

    auto result = reconciler_->reconcile(ipn("pay-1", "partially_paid", "0.003"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::FINALIZED);
}

TEST_F(SettlementReconcilerTest, Underpaid_ReleasesReservations) {
    openPurchase("pay-1", "0.002");

    auto result = reconciler_->reconcile(ipn("pay-1", "partially_paid", "0.0015"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::UNDERPAID_RELEASED);
    EXPECT_FALSE(store_->hasPending("pay-1"));
    EXPECT_EQ(store_->purchaseCount(5), 0);
    EXPECT_EQ(store_->entryCount(5), 0);
    EXPECT_EQ(store_->product(ringId_).reserved, 0);
    EXPECT_EQ(store_->product(ringId_).available, 2);
}

TEST_F(SettlementReconcilerTest, Failed_ReleasesReservations) {
    openPurchase("pay-1", "0.002");

    auto result = reconciler_->reconcile(ipn("pay-1", "expired", "0"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::FAILED_RELEASED);
    EXPECT_EQ(store_->entryCount(5), 0);
    EXPECT_EQ(store_->product(watchId_).reserved, 0);
}

TEST_F(SettlementReconcilerTest, FinalizationFailed_CriticalAndKeptForOperator) {
    openPurchase("pay-1", "0.002");
    // резерв часов снят, а единицу забрал другой покупатель
    store_->releaseEntry(5, watchId_);
    domain::ProductSelector s;
    s.category = "watch";
    s.variant = "black";
    s.price = domain::Money::parse("40", "eur");
    ASSERT_TRUE(store_->reserveUnit(6, s, clock_->now()).has_value());

    auto result = reconciler_->reconcile(ipn("pay-1", "finished", "0.002"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::FINALIZATION_FAILED);
    EXPECT_TRUE(result.critical());
    ASSERT_TRUE(store_->hasPending("pay-1"));
    EXPECT_EQ(store_->find("pay-1")->state, domain::SettlementState::ATTENTION_REQUIRED);
    EXPECT_TRUE(outbox_->hasAlert("FINALIZATION_FAILED"));
    EXPECT_EQ(store_->purchaseCount(5), 0);

    auto again = reconciler_->reconcile(ipn("pay-1", "finished", "0.002"));
    EXPECT_EQ(again.outcome, domain::ReconcileOutcome::AWAITING_OPERATOR);
}

TEST_F(SettlementReconcilerTest, AssetMismatch_CriticalNoSideEffects) {
    openPurchase("pay-1", "0.002");

    auto result = reconciler_->reconcile(ipn("pay-1", "finished", "0.05", "eth"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::ASSET_MISMATCH);
    EXPECT_TRUE(result.critical());
    EXPECT_TRUE(outbox_->hasAlert("ASSET_MISMATCH"));
    EXPECT_EQ(store_->find("pay-1")->state, domain::SettlementState::ATTENTION_REQUIRED);
    EXPECT_EQ(store_->entryCount(5), 2);
    EXPECT_EQ(store_->purchaseCount(5), 0);
}

// ============================================================================
// IGNORED
// ============================================================================

TEST_F(SettlementReconcilerTest, ChildPayment_Ignored) {
    openPurchase("pay-1", "0.002");
    auto n = ipn("pay-1", "finished", "0.002");
    n.parentPaymentId = "pay-0";

    auto result = reconciler_->reconcile(n);

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::IGNORED_CHILD);
    EXPECT_TRUE(store_->hasPending("pay-1"));
}

TEST_F(SettlementReconcilerTest, InProgressStatus_KeepsRecordOpen) {
    openPurchase("pay-1", "0.002");

    auto result = reconciler_->reconcile(ipn("pay-1", "confirming", "0.002"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::IGNORED_STATUS);
    EXPECT_EQ(store_->find("pay-1")->state, domain::SettlementState::OPEN);
}

TEST_F(SettlementReconcilerTest, ZeroPaid_Ignored) {
    openPurchase("pay-1", "0.002");

    auto result = reconciler_->reconcile(ipn("pay-1", "finished", "0"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::IGNORED_ZERO_AMOUNT);
    EXPECT_TRUE(store_->hasPending("pay-1"));
}

TEST_F(SettlementReconcilerTest, UnknownPaymentId) {
    auto result = reconciler_->reconcile(ipn("pay-x", "finished", "1"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::UNKNOWN_PAYMENT);
}

TEST_F(SettlementReconcilerTest, DatastoreDown_Unavailable) {
    openPurchase("pay-1", "0.002");
    store_->setUnavailable(true);

    auto result = reconciler_->reconcile(ipn("pay-1", "finished", "0.002"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::DATASTORE_UNAVAILABLE);

    store_->setUnavailable(false);
    EXPECT_TRUE(store_->hasPending("pay-1"));
}

// ============================================================================
// TOP-UP
// ============================================================================

TEST_F(SettlementReconcilerTest, TopUp_FullPayment_CreditsTarget) {
    openTopUp("top-1", "50", "0.001");

    auto result = reconciler_->reconcile(ipn("top-1", "finished", "0.001"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::CREDITED);
    EXPECT_EQ(result.credited.toString(), "50.00");
    EXPECT_EQ(store_->getBalance(5).toString(), "50.00");
    EXPECT_FALSE(store_->hasPending("top-1"));
}

TEST_F(SettlementReconcilerTest, TopUp_PartialPayment_CreditsProportionally) {
    openTopUp("top-1", "50", "0.001");

    auto result = reconciler_->reconcile(ipn("top-1", "partially_paid", "0.0005"));

    EXPECT_EQ(result.credited.toString(), "25.00");
}

TEST_F(SettlementReconcilerTest, TopUp_FeeAdjustment_RoundsDown) {
    settings_->feeAdjustment = domain::Money::parse("0.98", "eur");
    openTopUp("top-1", "10", "0.0003");

    // 10 * 0.0001 / 0.0003 * 0.98 = 3.2666.. -> 3.26
    auto result = reconciler_->reconcile(ipn("top-1", "finished", "0.0001"));

    EXPECT_EQ(result.credited.toString(), "3.26");
}

TEST_F(SettlementReconcilerTest, TopUp_DoubleDelivery_CreditedOnce) {
    openTopUp("top-1", "50", "0.001");

    reconciler_->reconcile(ipn("top-1", "finished", "0.001"));
    auto second = reconciler_->reconcile(ipn("top-1", "finished", "0.001"));

    EXPECT_EQ(second.outcome, domain::ReconcileOutcome::UNKNOWN_PAYMENT);
    EXPECT_EQ(store_->getBalance(5).toString(), "50.00");
}

TEST_F(SettlementReconcilerTest, TopUp_CreditRoundsToZero_Closed) {
    openTopUp("top-1", "1", "1");

    auto result = reconciler_->reconcile(ipn("top-1", "finished", "0.000001"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::ZERO_CREDIT_CLOSED);
    EXPECT_FALSE(store_->hasPending("top-1"));
    EXPECT_TRUE(store_->getBalance(5).isZero());
}

TEST_F(SettlementReconcilerTest, TopUp_ZeroExpected_InvalidQuote) {
    openTopUp("top-1", "50", "0");

    auto result = reconciler_->reconcile(ipn("top-1", "finished", "0.001"));

    EXPECT_EQ(result.outcome, domain::ReconcileOutcome::INVALID_QUOTE);
    EXPECT_TRUE(outbox_->hasAlert("INVALID_QUOTE"));
    EXPECT_TRUE(store_->getBalance(5).isZero());
}
