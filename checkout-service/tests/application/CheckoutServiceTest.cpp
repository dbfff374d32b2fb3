/**
 * @file CheckoutServiceTest.cpp
 * @brief Unit tests for CheckoutService
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/CheckoutService.hpp"
#include "application/ReservationService.hpp"
#include "../mocks/InMemoryStore.hpp"
#include "../mocks/FakeClock.hpp"
#include "../mocks/MockPaymentProcessor.hpp"
#include "../mocks/RecordingOutbox.hpp"
#include "../mocks/TestSettings.hpp"
#include <functional>

using namespace checkout;
using namespace checkout::application;
using namespace checkout::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Invoke;

namespace {

/**
 * @brief Журнал покупок, который перед первой фиксацией выполняет чужую покупку
 */
class InterleavingPurchaseRepository : public ports::output::IPurchaseRepository {
public:
    InterleavingPurchaseRepository(std::shared_ptr<ports::output::IPurchaseRepository> inner,
                                   std::function<void()> beforeFirstCommit)
        : inner_(std::move(inner)), beforeFirstCommit_(std::move(beforeFirstCommit)) {}

    domain::FinalizeResult commitPurchase(const domain::PurchaseCommit& commit) override {
        if (beforeFirstCommit_) {
            auto action = std::move(beforeFirstCommit_);
            beforeFirstCommit_ = nullptr;
            action();
        }
        return inner_->commitPurchase(commit);
    }

    std::vector<domain::PurchaseRecord> history(int64_t buyerId, int limit) override {
        return inner_->history(buyerId, limit);
    }

private:
    std::shared_ptr<ports::output::IPurchaseRepository> inner_;
    std::function<void()> beforeFirstCommit_;
};

} // namespace

class CheckoutServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryStore>();
        clock_ = std::make_shared<FakeClock>();
        outbox_ = std::make_shared<RecordingOutbox>();
        settings_ = std::make_shared<TestCheckoutSettings>();
        sessions_ = std::make_shared<SessionRegistry>();
        processor_ = std::make_shared<::testing::NiceMock<MockPaymentProcessor>>();

        reservations_ = std::make_shared<ReservationService>(
            store_, store_->discountCodes(), store_, sessions_, clock_, settings_);
        auto finalizer = std::make_shared<PurchaseFinalizer>(store_, store_, clock_);
        auto broker = std::make_shared<PaymentIntentBroker>(processor_, store_, outbox_, clock_, settings_);

        service_ = std::make_shared<CheckoutService>(
            reservations_, finalizer, broker, store_, store_, store_, outbox_, sessions_, settings_);

        ringId_ = store_->addProduct("paris", "ring", "gold", "60", 3);
        watchId_ = store_->addProduct("berlin", "watch", "black", "40", 3);

        domain::DiscountCode code;
        code.code = "SAVE10";
        code.value = domain::Money(10, 0, "%");
        store_->addDiscountCode(code);
    }

    void addToBasket(int64_t buyerId, const std::string& category, const std::string& variant,
                     const std::string& price) {
        domain::ProductSelector s;
        s.category = category;
        s.variant = variant;
        s.price = domain::Money::parse(price, "eur");
        ASSERT_TRUE(reservations_->reserve(buyerId, s).reserved());
    }

    void expectProcessorOpens(const std::string& paymentId, const std::string& payAmount) {
        ON_CALL(*processor_, estimate(_, _))
            .WillByDefault(Return(domain::Money::parse(payAmount, "btc")));
        ON_CALL(*processor_, minimumAmount(_))
            .WillByDefault(Return(domain::Money::parse("0.00001", "btc")));
        ON_CALL(*processor_, createPayment(_))
            .WillByDefault(Invoke([paymentId](const domain::PaymentRequest& req) {
                domain::PaymentIntent i;
                i.paymentId = paymentId;
                i.payAddress = "bc1qaddress";
                i.payAmount = req.amount;
                i.payCurrency = req.asset;
                return i;
            }));
    }

    std::shared_ptr<InMemoryStore> store_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<RecordingOutbox> outbox_;
    std::shared_ptr<TestCheckoutSettings> settings_;
    std::shared_ptr<SessionRegistry> sessions_;
    std::shared_ptr<::testing::NiceMock<MockPaymentProcessor>> processor_;
    std::shared_ptr<ReservationService> reservations_;
    std::shared_ptr<CheckoutService> service_;
    int64_t ringId_ = 0;
    int64_t watchId_ = 0;
};

// ============================================================================
// BALANCE CHECKOUT
// ============================================================================

TEST_F(CheckoutServiceTest, Balance_Sufficient_Completes) {
    store_->setBalance(1, "150");
    addToBasket(1, "ring", "gold", "60");
    addToBasket(1, "watch", "black", "40");
    reservations_->applyDiscount(1, "SAVE10");

    auto result = service_->checkout(1, domain::CheckoutMethod::BALANCE, "");

    EXPECT_EQ(result.status, domain::CheckoutStatus::COMPLETED);
    EXPECT_EQ(result.itemCount, 2);
    EXPECT_EQ(result.finalTotal.toString(), "90.00");
    EXPECT_EQ(store_->getBalance(1).toString(), "60.00");
    EXPECT_EQ(store_->usesOf("SAVE10"), 1);
    EXPECT_EQ(store_->purchaseCount(1), 2);
    EXPECT_EQ(store_->entryCount(1), 0);
    EXPECT_EQ(sessions_->appliedCode(1), "");
    EXPECT_EQ(outbox_->notices().size(), 1u);
}

TEST_F(CheckoutServiceTest, Balance_Insufficient_BasketKept) {
    store_->setBalance(1, "50");
    addToBasket(1, "ring", "gold", "60");

    auto result = service_->checkout(1, domain::CheckoutMethod::BALANCE, "");

    EXPECT_EQ(result.status, domain::CheckoutStatus::INSUFFICIENT_BALANCE);
    EXPECT_EQ(store_->getBalance(1).toString(), "50.00");
    EXPECT_EQ(store_->entryCount(1), 1);
    EXPECT_EQ(store_->purchaseCount(1), 0);
}

TEST_F(CheckoutServiceTest, Balance_ResellerPriceRecordedButTotalDebited) {
    store_->setBalance(1, "100");
    store_->setResellerPercent(1, "ring", 50);
    addToBasket(1, "ring", "gold", "60");

    auto result = service_->checkout(1, domain::CheckoutMethod::BALANCE, "");

    ASSERT_EQ(result.status, domain::CheckoutStatus::COMPLETED);
    EXPECT_EQ(store_->getBalance(1).toString(), "40.00");
    auto history = service_->purchaseHistory(1, 10);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].pricePaid.toString(), "30.00");
}

TEST_F(CheckoutServiceTest, Balance_GeneralAndResellerDiscountsCompose) {
    auto pendantId = store_->addProduct("paris", "pendant", "silver", "50", 1);
    store_->addProduct("paris", "chain", "silver", "50", 1);
    store_->setBalance(1, "100");
    store_->setResellerPercent(1, "pendant", 20);
    addToBasket(1, "pendant", "silver", "50");
    addToBasket(1, "chain", "silver", "50");
    reservations_->applyDiscount(1, "SAVE10");

    auto result = service_->checkout(1, domain::CheckoutMethod::BALANCE, "");

    ASSERT_EQ(result.status, domain::CheckoutStatus::COMPLETED);
    EXPECT_EQ(result.originalTotal.toString(), "100.00");
    EXPECT_EQ(result.finalTotal.toString(), "90.00");
    EXPECT_EQ(store_->getBalance(1).toString(), "10.00");

    for (const auto& record : service_->purchaseHistory(1, 10)) {
        if (record.productId == pendantId) {
            EXPECT_EQ(record.pricePaid.toString(), "40.00");
        } else {
            EXPECT_EQ(record.pricePaid.toString(), "50.00");
        }
    }
}

TEST_F(CheckoutServiceTest, Balance_CodeUsedUpByConcurrentCheckout_RejectedNothingCharged) {
    domain::DiscountCode once;
    once.code = "ONCE";
    once.value = domain::Money(10, 0, "%");
    once.maxUses = 1;
    store_->addDiscountCode(once);
    store_->setBalance(1, "100");
    store_->setBalance(2, "100");
    addToBasket(1, "ring", "gold", "60");
    addToBasket(2, "ring", "gold", "60");
    ASSERT_TRUE(reservations_->applyDiscount(1, "ONCE").applied());
    ASSERT_TRUE(reservations_->applyDiscount(2, "ONCE").applied());

    // покупатель 2 оформляет корзину между проверкой кода и фиксацией покупателя 1
    auto interleaved = std::make_shared<InterleavingPurchaseRepository>(store_, [this]() {
        auto other = service_->checkout(2, domain::CheckoutMethod::BALANCE, "");
        EXPECT_EQ(other.status, domain::CheckoutStatus::COMPLETED);
        EXPECT_EQ(other.finalTotal.toString(), "54.00");
    });
    auto finalizer = std::make_shared<PurchaseFinalizer>(interleaved, store_, clock_);
    auto broker = std::make_shared<PaymentIntentBroker>(processor_, store_, outbox_, clock_, settings_);
    CheckoutService racing(reservations_, finalizer, broker, store_, store_, store_, outbox_, sessions_, settings_);

    auto result = racing.checkout(1, domain::CheckoutMethod::BALANCE, "");

    EXPECT_EQ(result.status, domain::CheckoutStatus::DISCOUNT_REJECTED);
    EXPECT_NE(result.message.find("ONCE"), std::string::npos);
    EXPECT_LE(store_->usesOf("ONCE"), 1);
    EXPECT_EQ(store_->getBalance(1).toString(), "100.00");
    EXPECT_EQ(store_->getBalance(2).toString(), "46.00");
    EXPECT_EQ(store_->purchaseCount(1), 0);
    EXPECT_EQ(store_->entryCount(1), 1);
    EXPECT_EQ(sessions_->appliedCode(1), "");

    // повторное оформление идёт по полной цене
    auto retry = racing.checkout(1, domain::CheckoutMethod::BALANCE, "");

    EXPECT_EQ(retry.status, domain::CheckoutStatus::COMPLETED);
    EXPECT_EQ(store_->getBalance(1).toString(), "40.00");
    EXPECT_EQ(store_->usesOf("ONCE"), 1);
}

TEST_F(CheckoutServiceTest, Balance_NoticeCarriesPickupDetails) {
    store_->addProduct("paris", "pendant", "silver", "50", 1, "Silver pendant", "Locker 12, code 4471");
    store_->setBalance(1, "100");
    addToBasket(1, "pendant", "silver", "50");

    auto result = service_->checkout(1, domain::CheckoutMethod::BALANCE, "");

    ASSERT_EQ(result.status, domain::CheckoutStatus::COMPLETED);
    auto notices = outbox_->notices();
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].buyerId, 1);
    EXPECT_NE(notices[0].text.find("--- Item: Silver pendant silver ---"), std::string::npos);
    EXPECT_NE(notices[0].text.find("Locker 12, code 4471"), std::string::npos);
}

TEST_F(CheckoutServiceTest, EmptyBasket) {
    auto result = service_->checkout(1, domain::CheckoutMethod::BALANCE, "");

    EXPECT_EQ(result.status, domain::CheckoutStatus::EMPTY_BASKET);
}

TEST_F(CheckoutServiceTest, ExpiredBasket_EmptyWithExpiryMessage) {
    addToBasket(1, "ring", "gold", "60");
    clock_->advance(std::chrono::seconds(901));

    auto result = service_->checkout(1, domain::CheckoutMethod::BALANCE, "");

    EXPECT_EQ(result.status, domain::CheckoutStatus::EMPTY_BASKET);
    EXPECT_NE(result.message.find("expired"), std::string::npos);
    EXPECT_EQ(store_->product(ringId_).reserved, 0);
}

TEST_F(CheckoutServiceTest, DatastoreDown_Failed) {
    addToBasket(1, "ring", "gold", "60");
    store_->setUnavailable(true);

    auto result = service_->checkout(1, domain::CheckoutMethod::BALANCE, "");

    EXPECT_EQ(result.status, domain::CheckoutStatus::FAILED);
}

// ============================================================================
// CRYPTO CHECKOUT
// ============================================================================

TEST_F(CheckoutServiceTest, Crypto_OpensIntentWithSnapshot) {
    expectProcessorOpens("pay-77", "0.0015");
    addToBasket(1, "ring", "gold", "60");
    addToBasket(1, "watch", "black", "40");
    reservations_->applyDiscount(1, "SAVE10");

    auto result = service_->checkout(1, domain::CheckoutMethod::CRYPTO, "btc");

    ASSERT_EQ(result.status, domain::CheckoutStatus::PAYMENT_PENDING);
    ASSERT_TRUE(result.intent.has_value());
    EXPECT_EQ(result.intent->paymentId, "pay-77");

    auto record = store_->find("pay-77");
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->isPurchase);
    EXPECT_EQ(record->targetAmount.toString(), "90.00");
    EXPECT_EQ(record->snapshot.items.size(), 2u);
    ASSERT_TRUE(record->discountCode.has_value());
    EXPECT_EQ(*record->discountCode, "SAVE10");
    // резервы остаются до подтверждения платежа
    EXPECT_EQ(store_->entryCount(1), 2);
}

TEST_F(CheckoutServiceTest, Crypto_NoAsset_InvalidRequest) {
    addToBasket(1, "ring", "gold", "60");

    auto result = service_->checkout(1, domain::CheckoutMethod::CRYPTO, "");

    EXPECT_EQ(result.status, domain::CheckoutStatus::INVALID_REQUEST);
}

TEST_F(CheckoutServiceTest, Crypto_ProcessorDown_PaymentFailedBasketKept) {
    ON_CALL(*processor_, estimate(_, _))
        .WillByDefault(::testing::Throw(domain::PaymentProcessorException(
            domain::ProcessorErrorKind::TRANSIENT, "502", 502)));
    addToBasket(1, "ring", "gold", "60");

    auto result = service_->checkout(1, domain::CheckoutMethod::CRYPTO, "btc");

    EXPECT_EQ(result.status, domain::CheckoutStatus::PAYMENT_FAILED);
    ASSERT_TRUE(result.intentStatus.has_value());
    EXPECT_EQ(*result.intentStatus, domain::IntentStatus::PROCESSOR_UNAVAILABLE);
    EXPECT_EQ(store_->entryCount(1), 1);
}

// ============================================================================
// TOP-UP / BALANCE / HISTORY
// ============================================================================

TEST_F(CheckoutServiceTest, TopUp_BelowMinimum) {
    auto result = service_->openTopUp(1, domain::Money::parse("0.99", "eur"), "btc");

    EXPECT_EQ(result.status, domain::IntentStatus::BELOW_MINIMUM);
}

TEST_F(CheckoutServiceTest, TopUp_OpensIntent) {
    expectProcessorOpens("top-5", "0.0003");

    auto result = service_->openTopUp(1, domain::Money::parse("20.567", "eur"), "btc");

    ASSERT_TRUE(result.opened());
    auto record = store_->find("top-5");
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->isPurchase);
    EXPECT_EQ(record->targetAmount.toString(), "20.56");
}

TEST_F(CheckoutServiceTest, Balance_UnknownBuyerIsZero) {
    EXPECT_TRUE(service_->balance(99).isZero());
}

TEST_F(CheckoutServiceTest, PurchaseHistory_LimitClamped) {
    store_->setBalance(1, "1000");
    for (int i = 0; i < 3; ++i) {
        addToBasket(1, "watch", "black", "40");
        ASSERT_EQ(service_->checkout(1, domain::CheckoutMethod::BALANCE, "").status,
                  domain::CheckoutStatus::COMPLETED);
    }

    EXPECT_EQ(service_->purchaseHistory(1, 2).size(), 2u);
    EXPECT_EQ(service_->purchaseHistory(1, 0).size(), 3u);
    EXPECT_EQ(service_->purchaseHistory(1, 500).size(), 3u);
}
