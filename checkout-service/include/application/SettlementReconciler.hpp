#pragma once

#include "ports/input/ISettlementReconciler.hpp"
#include "ports/output/IPendingSettlementRepository.hpp"
#include "ports/output/IBuyerRepository.hpp"
#include "ports/output/INotificationOutbox.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "application/PurchaseFinalizer.hpp"
#include "domain/enums/PaymentStatus.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>

namespace checkout::application {

/**
 * @brief Сведение уведомлений процессора с записями PendingSettlement
 *
 * Единственная точка истины: хранилище. Каждое закрытие записи
 * (финализация, зачисление, снятие резервов) удаляет её в той же транзакции,
 * поэтому повторная доставка того же уведомления видит UNKNOWN_PAYMENT.
 *
 * Переходы для записи:
 *   OPEN --PAID, покупка, оплачено полностью--> финализация → закрыта
 *   OPEN --PAID, покупка, недоплата--> снятие резервов → закрыта
 *   OPEN --PAID, пополнение--> зачисление пропорционально → закрыта
 *   OPEN --FAILED--> снятие резервов → закрыта
 *   OPEN --финализация не удалась--> ATTENTION_REQUIRED (ждёт оператора)
 */
class SettlementReconciler : public ports::input::ISettlementReconciler {
public:
    SettlementReconciler(
        std::shared_ptr<ports::output::IPendingSettlementRepository> pending,
        std::shared_ptr<ports::output::IBuyerRepository> buyers,
        std::shared_ptr<PurchaseFinalizer> finalizer,
        std::shared_ptr<ports::output::INotificationOutbox> outbox,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : pending_(std::move(pending))
      , buyers_(std::move(buyers))
      , finalizer_(std::move(finalizer))
      , outbox_(std::move(outbox))
      , settings_(std::move(settings))
    {
        std::cout << "[SettlementReconciler] Created, fee adjustment "
                  << settings_->getFeeAdjustment().toString() << std::endl;
    }

    domain::ReconcileResult reconcile(const domain::SettlementNotification& n) override {
        domain::ReconcileResult result;
        result.paymentId = n.paymentId;
        result.credited = domain::Money::zero(settings_->getSettlementCurrency());

        if (n.parentPaymentId && !n.parentPaymentId->empty()) {
            std::cout << "[SettlementReconciler] Ignoring child payment " << n.paymentId
                      << " of " << *n.parentPaymentId << std::endl;
            return done(result, domain::ReconcileOutcome::IGNORED_CHILD, "Child payment ignored");
        }

        try {
            auto record = pending_->find(n.paymentId);
            if (!record) {
                std::cout << "[SettlementReconciler] No pending record for " << n.paymentId
                          << " (status " << n.paymentStatus << ")" << std::endl;
                return done(result, domain::ReconcileOutcome::UNKNOWN_PAYMENT, "No pending settlement");
            }
            if (record->state == domain::SettlementState::ATTENTION_REQUIRED) {
                std::cout << "[SettlementReconciler] " << n.paymentId
                          << " is awaiting operator, notification ignored" << std::endl;
                return done(result, domain::ReconcileOutcome::AWAITING_OPERATOR, "Awaiting operator");
            }

            switch (domain::classifyPaymentStatus(n.paymentStatus)) {
                case domain::PaymentStatus::PAID:
                    return onPaid(*record, n, result);
                case domain::PaymentStatus::FAILED:
                    return onFailed(*record, n, result);
                case domain::PaymentStatus::IN_PROGRESS:
                    std::cout << "[SettlementReconciler] " << n.paymentId << " status "
                              << n.paymentStatus << " ignored" << std::endl;
                    return done(result, domain::ReconcileOutcome::IGNORED_STATUS, "Status ignored");
            }
            return done(result, domain::ReconcileOutcome::IGNORED_STATUS, "Status ignored");

        } catch (const std::exception& e) {
            std::cerr << "[SettlementReconciler] Datastore error for " << n.paymentId
                      << ": " << e.what() << std::endl;
            return done(result, domain::ReconcileOutcome::DATASTORE_UNAVAILABLE, e.what());
        }
    }

private:
    std::shared_ptr<ports::output::IPendingSettlementRepository> pending_;
    std::shared_ptr<ports::output::IBuyerRepository> buyers_;
    std::shared_ptr<PurchaseFinalizer> finalizer_;
    std::shared_ptr<ports::output::INotificationOutbox> outbox_;
    std::shared_ptr<settings::ICheckoutSettings> settings_;

    static domain::ReconcileResult& done(domain::ReconcileResult& r,
                                         domain::ReconcileOutcome outcome,
                                         const std::string& message) {
        r.outcome = outcome;
        r.message = message;
        return r;
    }

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    /**
     * @brief Оставить запись, пометить для оператора и поднять алерт
     */
    domain::ReconcileResult escalate(const domain::PendingSettlement& record,
                                     domain::ReconcileResult& result,
                                     domain::ReconcileOutcome outcome,
                                     const std::string& details) {
        std::cerr << "[SettlementReconciler] CRITICAL " << domain::toString(outcome) << " "
                  << record.paymentId << " buyer " << record.buyerId << ": " << details << std::endl;
        pending_->markAttentionRequired(record.paymentId, domain::toString(outcome) + ": " + details);
        outbox_->raiseOperatorAlert(domain::toString(outcome), record.paymentId,
                                    "buyer " + std::to_string(record.buyerId) + ": " + details);
        return done(result, outcome, details);
    }

    domain::ReconcileResult onPaid(const domain::PendingSettlement& record,
                                   const domain::SettlementNotification& n,
                                   domain::ReconcileResult& result) {
        if (!n.actuallyPaid.isPositive()) {
            std::cout << "[SettlementReconciler] " << n.paymentId << " " << n.paymentStatus
                      << " with actually_paid " << n.actuallyPaid.toString() << ", ignored" << std::endl;
            return done(result, domain::ReconcileOutcome::IGNORED_ZERO_AMOUNT, "Zero amount paid");
        }

        if (toLower(n.payCurrency) != toLower(record.settlementAsset)) {
            return escalate(record, result, domain::ReconcileOutcome::ASSET_MISMATCH,
                            "paid in " + n.payCurrency + ", expected " + record.settlementAsset);
        }

        if (record.isPurchase) {
            return onPurchasePaid(record, n, result);
        }
        return onTopUpPaid(record, n, result);
    }

    domain::ReconcileResult onPurchasePaid(const domain::PendingSettlement& record,
                                           const domain::SettlementNotification& n,
                                           domain::ReconcileResult& result) {
        if (n.actuallyPaid < record.expectedAssetAmount) {
            if (!pending_->closeAndRelease(record.paymentId, true)) {
                return done(result, domain::ReconcileOutcome::UNKNOWN_PAYMENT, "Already settled");
            }
            std::cout << "[SettlementReconciler] " << record.paymentId << " underpaid: "
                      << n.actuallyPaid.toString() << " < " << record.expectedAssetAmount.toString()
                      << " " << record.settlementAsset << ", reservations released" << std::endl;
            outbox_->notifyBuyer(record.buyerId,
                "Payment " + record.paymentId + " received " + n.actuallyPaid.toString() + " " +
                record.settlementAsset + " of " + record.expectedAssetAmount.toString() +
                ". A partial payment cannot complete the purchase; your reserved items were released.");
            return done(result, domain::ReconcileOutcome::UNDERPAID_RELEASED, "Underpaid, released");
        }

        auto finalized = finalizer_->finalize(record.buyerId, record.snapshot, record.discountCode,
                                              record.paymentId, std::nullopt);
        switch (finalized.status) {
            case domain::FinalizeStatus::SUCCESS:
                outbox_->notifyBuyer(record.buyerId, PurchaseFinalizer::deliveryNotice(
                    "Payment " + record.paymentId + " confirmed. Purchase of " +
                    std::to_string(finalized.itemCount) + " items completed.",
                    finalized));
                return done(result, domain::ReconcileOutcome::FINALIZED, "Purchase finalized");

            case domain::FinalizeStatus::ALREADY_SETTLED:
                return done(result, domain::ReconcileOutcome::UNKNOWN_PAYMENT, "Already settled");

            case domain::FinalizeStatus::UNIT_UNAVAILABLE:
            case domain::FinalizeStatus::INSUFFICIENT_BALANCE:
            case domain::FinalizeStatus::DISCOUNT_REJECTED:
            case domain::FinalizeStatus::FAILED:
                break;
        }

        auto critical = escalate(record, result, domain::ReconcileOutcome::FINALIZATION_FAILED,
                                 "payment received, goods not granted: " +
                                 domain::toString(finalized.status) + " " + finalized.message);
        outbox_->notifyBuyer(record.buyerId,
            "Payment " + record.paymentId + " was received but the order could not be completed "
            "automatically. Support has been alerted and will resolve it.");
        return critical;
    }

    domain::ReconcileResult onTopUpPaid(const domain::PendingSettlement& record,
                                        const domain::SettlementNotification& n,
                                        domain::ReconcileResult& result) {
        if (!record.expectedAssetAmount.isPositive()) {
            return escalate(record, result, domain::ReconcileOutcome::INVALID_QUOTE,
                            "expected amount is zero, received " + n.actuallyPaid.toString() +
                            " " + n.payCurrency);
        }

        auto credited = record.targetAmount
            .scaled(n.actuallyPaid, record.expectedAssetAmount)
            .times(settings_->getFeeAdjustment())
            .roundDownCents();
        credited.currency = settings_->getSettlementCurrency();

        if (!credited.isPositive()) {
            if (!pending_->closeAndRelease(record.paymentId, false)) {
                return done(result, domain::ReconcileOutcome::UNKNOWN_PAYMENT, "Already settled");
            }
            std::cout << "[SettlementReconciler] " << record.paymentId
                      << " credit rounds to zero, closed without credit" << std::endl;
            outbox_->notifyBuyer(record.buyerId,
                "Payment " + record.paymentId + " was too small to credit any balance.");
            return done(result, domain::ReconcileOutcome::ZERO_CREDIT_CLOSED, "Zero credit");
        }

        if (!buyers_->creditSettlement(record.paymentId, record.buyerId, credited)) {
            return done(result, domain::ReconcileOutcome::UNKNOWN_PAYMENT, "Already settled");
        }

        std::cout << "[SettlementReconciler] " << record.paymentId << " credited "
                  << credited.toString() << " to buyer " << record.buyerId << " (paid "
                  << n.actuallyPaid.toString() << " of " << record.expectedAssetAmount.toString()
                  << " " << record.settlementAsset << ")" << std::endl;
        outbox_->notifyBuyer(record.buyerId,
            "Top-up " + record.paymentId + " confirmed: " + credited.toString() + " " +
            credited.currency + " added to your balance.");
        result.credited = credited;
        return done(result, domain::ReconcileOutcome::CREDITED, "Balance credited");
    }

    domain::ReconcileResult onFailed(const domain::PendingSettlement& record,
                                     const domain::SettlementNotification& n,
                                     domain::ReconcileResult& result) {
        if (!pending_->closeAndRelease(record.paymentId, record.isPurchase)) {
            return done(result, domain::ReconcileOutcome::UNKNOWN_PAYMENT, "Already settled");
        }
        std::cout << "[SettlementReconciler] " << record.paymentId << " " << n.paymentStatus
                  << ", record closed" << (record.isPurchase ? " and reservations released" : "")
                  << std::endl;
        outbox_->notifyBuyer(record.buyerId,
            "Payment " + record.paymentId + " was " + n.paymentStatus + "." +
            (record.isPurchase ? " Your reserved items were released." : ""));
        return done(result, domain::ReconcileOutcome::FAILED_RELEASED, "Closed");
    }
};

} // namespace checkout::application
