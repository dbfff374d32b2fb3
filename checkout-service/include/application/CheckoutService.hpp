#pragma once

#include "ports/input/ICheckoutService.hpp"
#include "ports/input/IReservationService.hpp"
#include "ports/output/IPurchaseRepository.hpp"
#include "ports/output/IBuyerRepository.hpp"
#include "ports/output/IResellerDiscountRepository.hpp"
#include "ports/output/INotificationOutbox.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "application/PaymentIntentBroker.hpp"
#include "application/PurchaseFinalizer.hpp"
#include "application/DiscountResolver.hpp"
#include "application/SessionRegistry.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>

namespace checkout::application {

/**
 * @brief Оформление корзины (с баланса или криптой) и пополнение баланса
 *
 * Перед оформлением корзина всегда перечитывается через viewBasket:
 * снимаются просроченные резервы и заново считается скидка по коду.
 */
class CheckoutService : public ports::input::ICheckoutService {
public:
    static constexpr int DEFAULT_HISTORY_LIMIT = 10;
    static constexpr int MAX_HISTORY_LIMIT = 50;

    CheckoutService(
        std::shared_ptr<ports::input::IReservationService> reservations,
        std::shared_ptr<PurchaseFinalizer> finalizer,
        std::shared_ptr<PaymentIntentBroker> broker,
        std::shared_ptr<ports::output::IPurchaseRepository> purchases,
        std::shared_ptr<ports::output::IBuyerRepository> buyers,
        std::shared_ptr<ports::output::IResellerDiscountRepository> resellerDiscounts,
        std::shared_ptr<ports::output::INotificationOutbox> outbox,
        std::shared_ptr<SessionRegistry> sessions,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : reservations_(std::move(reservations))
      , finalizer_(std::move(finalizer))
      , broker_(std::move(broker))
      , purchases_(std::move(purchases))
      , buyers_(std::move(buyers))
      , resellerDiscounts_(std::move(resellerDiscounts))
      , outbox_(std::move(outbox))
      , sessions_(std::move(sessions))
      , settings_(std::move(settings))
    {
        std::cout << "[CheckoutService] Created" << std::endl;
    }

    domain::CheckoutResult checkout(int64_t buyerId,
                                    domain::CheckoutMethod method,
                                    const std::string& asset) override {
        domain::CheckoutResult result;

        try {
            auto basket = reservations_->viewBasket(buyerId);
            result.itemCount = static_cast<int>(basket.items.size());
            result.originalTotal = basket.originalTotal;
            result.discountAmount = basket.discount.discountAmount;
            result.finalTotal = basket.finalTotal;

            if (basket.empty()) {
                result.status = domain::CheckoutStatus::EMPTY_BASKET;
                result.message = basket.expiredReleased > 0
                    ? "Your reservations expired, the basket is empty"
                    : "Basket is empty";
                return result;
            }

            std::optional<std::string> code;
            if (basket.discount.applied()) {
                code = basket.discount.code;
            }

            if (method == domain::CheckoutMethod::BALANCE) {
                return payFromBalance(buyerId, basket, code, result);
            }
            return payWithCrypto(buyerId, basket, code, asset, result);

        } catch (const std::exception& e) {
            std::cerr << "[CheckoutService] Checkout failed for buyer " << buyerId
                      << ": " << e.what() << std::endl;
            result.status = domain::CheckoutStatus::FAILED;
            result.message = "Checkout failed, please retry";
            return result;
        }
    }

    domain::IntentResult openTopUp(int64_t buyerId,
                                   const domain::Money& amount,
                                   const std::string& asset) override {
        auto minimum = settings_->getMinTopUpAmount();
        if (amount < minimum) {
            domain::IntentResult result;
            result.status = domain::IntentStatus::BELOW_MINIMUM;
            result.message = "Minimum top-up is " + minimum.toString() + " " + settings_->getSettlementCurrency();
            return result;
        }

        domain::IntentRequest request;
        request.buyerId = buyerId;
        request.targetAmount = domain::Money::fromNanos(amount.roundDownCents().totalNanos(),
                                                        settings_->getSettlementCurrency());
        request.asset = asset;
        request.isPurchase = false;
        return broker_->openIntent(request);
    }

    domain::Money balance(int64_t buyerId) override {
        return buyers_->getBalance(buyerId);
    }

    std::vector<domain::PurchaseRecord> purchaseHistory(int64_t buyerId, int limit) override {
        if (limit <= 0) limit = DEFAULT_HISTORY_LIMIT;
        limit = std::min(limit, MAX_HISTORY_LIMIT);
        return purchases_->history(buyerId, limit);
    }

private:
    std::shared_ptr<ports::input::IReservationService> reservations_;
    std::shared_ptr<PurchaseFinalizer> finalizer_;
    std::shared_ptr<PaymentIntentBroker> broker_;
    std::shared_ptr<ports::output::IPurchaseRepository> purchases_;
    std::shared_ptr<ports::output::IBuyerRepository> buyers_;
    std::shared_ptr<ports::output::IResellerDiscountRepository> resellerDiscounts_;
    std::shared_ptr<ports::output::INotificationOutbox> outbox_;
    std::shared_ptr<SessionRegistry> sessions_;
    std::shared_ptr<settings::ICheckoutSettings> settings_;

    domain::CheckoutResult& payFromBalance(int64_t buyerId,
                                           const domain::BasketView& basket,
                                           const std::optional<std::string>& code,
                                           domain::CheckoutResult& result) {
        auto finalized = finalizer_->finalize(buyerId, snapshotOf(buyerId, basket), code,
                                              std::nullopt, basket.finalTotal);
        switch (finalized.status) {
            case domain::FinalizeStatus::SUCCESS:
                sessions_->setAppliedCode(buyerId, "");
                outbox_->notifyBuyer(buyerId, PurchaseFinalizer::deliveryNotice(
                    "Purchase of " + std::to_string(finalized.itemCount) + " items completed, " +
                    basket.finalTotal.toString() + " " + basket.finalTotal.currency + " charged to your balance.",
                    finalized));
                result.status = domain::CheckoutStatus::COMPLETED;
                result.message = "Purchase completed";
                break;
            case domain::FinalizeStatus::INSUFFICIENT_BALANCE:
                result.status = domain::CheckoutStatus::INSUFFICIENT_BALANCE;
                result.message = "Insufficient balance, top up or pay with crypto";
                break;
            case domain::FinalizeStatus::UNIT_UNAVAILABLE:
                result.status = domain::CheckoutStatus::FAILED;
                result.message = "An item in your basket is no longer available";
                break;
            case domain::FinalizeStatus::DISCOUNT_REJECTED:
                // код израсходован параллельной покупкой: снимаем его, корзина остаётся
                sessions_->setAppliedCode(buyerId, "");
                result.status = domain::CheckoutStatus::DISCOUNT_REJECTED;
                result.message = "Discount code " + code.value_or("") +
                                 " is no longer valid and was removed, review your basket and check out again";
                break;
            case domain::FinalizeStatus::ALREADY_SETTLED:
            case domain::FinalizeStatus::FAILED:
                result.status = domain::CheckoutStatus::FAILED;
                result.message = "Checkout failed, please retry";
                break;
        }
        return result;
    }

    domain::CheckoutResult& payWithCrypto(int64_t buyerId,
                                          const domain::BasketView& basket,
                                          const std::optional<std::string>& code,
                                          const std::string& asset,
                                          domain::CheckoutResult& result) {
        if (asset.empty()) {
            result.status = domain::CheckoutStatus::INVALID_REQUEST;
            result.message = "asset is required for crypto checkout";
            return result;
        }

        domain::IntentRequest request;
        request.buyerId = buyerId;
        request.targetAmount = basket.finalTotal;
        request.asset = asset;
        request.isPurchase = true;
        request.snapshot = snapshotOf(buyerId, basket);
        request.discountCode = code;

        auto opened = broker_->openIntent(request);
        if (!opened.opened()) {
            result.status = domain::CheckoutStatus::PAYMENT_FAILED;
            result.intentStatus = opened.status;
            result.message = opened.message;
            return result;
        }

        result.status = domain::CheckoutStatus::PAYMENT_PENDING;
        result.intentStatus = opened.status;
        result.intent = opened.intent;
        result.message = "Pay " + opened.intent->payAmount.toString() + " " + opened.intent->payCurrency +
                         " to " + opened.intent->payAddress;
        return result;
    }

    /**
     * @brief Снимок корзины с ценой позиции после скидки реселлера
     */
    domain::BasketSnapshot snapshotOf(int64_t buyerId, const domain::BasketView& basket) {
        domain::BasketSnapshot snapshot;
        std::map<std::string, domain::Percent> percentByCategory;
        for (const auto& entry : basket.items) {
            auto it = percentByCategory.find(entry.category);
            if (it == percentByCategory.end()) {
                it = percentByCategory.emplace(
                    entry.category, resellerDiscounts_->percentageFor(buyerId, entry.category)).first;
            }

            domain::SnapshotItem item;
            item.productId = entry.productId;
            item.name = entry.name;
            item.category = entry.category;
            item.variant = entry.variant;
            item.location = entry.location;
            item.catalogPrice = entry.reservedPrice;
            item.discountedPrice = DiscountResolver::resellerPrice(entry.reservedPrice, it->second);
            snapshot.items.push_back(item);
        }
        return snapshot;
    }
};

} // namespace checkout::application
