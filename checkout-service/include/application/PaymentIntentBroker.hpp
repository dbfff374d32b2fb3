#pragma once

#include "ports/output/IPaymentProcessor.hpp"
#include "ports/output/IPendingSettlementRepository.hpp"
#include "ports/output/INotificationOutbox.hpp"
#include "ports/output/IClock.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "domain/IntentResult.hpp"
#include "domain/PendingSettlement.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>

namespace checkout::application {

/**
 * @brief Открытие платёжного намерения у процессора
 *
 * Шаги: оценка суммы в активе → минимальная сумма → создание платежа →
 * сохранение PendingSettlement. Внешние вызовы делаются без открытых
 * транзакций. Неудача на любом шаге не трогает резервы корзины:
 * покупатель может повторить с другим активом.
 */
class PaymentIntentBroker {
public:
    PaymentIntentBroker(
        std::shared_ptr<ports::output::IPaymentProcessor> processor,
        std::shared_ptr<ports::output::IPendingSettlementRepository> pending,
        std::shared_ptr<ports::output::INotificationOutbox> outbox,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : processor_(std::move(processor))
      , pending_(std::move(pending))
      , outbox_(std::move(outbox))
      , clock_(std::move(clock))
      , settings_(std::move(settings))
      , rng_(std::random_device{}())
    {
        std::cout << "[PaymentIntentBroker] Created, callback "
                  << callbackUrl() << std::endl;
    }

    domain::IntentResult openIntent(const domain::IntentRequest& request) {
        domain::IntentResult result;
        std::string asset = toLower(request.asset);

        if (asset.empty() || !request.targetAmount.isPositive()) {
            result.status = domain::IntentStatus::PROCESSOR_REJECTED;
            result.message = "Asset and a positive amount are required";
            return result;
        }

        domain::PaymentIntent intent;
        domain::Money expected;
        try {
            auto estimated = processor_->estimate(request.targetAmount, asset);
            if (!estimated.isPositive()) {
                std::cerr << "[PaymentIntentBroker] Zero estimate for " << request.targetAmount.toString()
                          << " in " << asset << std::endl;
                result.status = domain::IntentStatus::INVALID_QUOTE;
                result.message = "Could not price this amount in " + asset;
                return result;
            }

            auto minimum = processor_->minimumAmount(asset);
            auto payAmount = estimated;
            if (estimated < minimum) {
                if (request.isPurchase) {
                    std::cout << "[PaymentIntentBroker] Basket total " << request.targetAmount.toString()
                              << " is " << estimated.toString() << " " << asset
                              << ", below minimum " << minimum.toString() << std::endl;
                    result.status = domain::IntentStatus::BELOW_MINIMUM;
                    result.message = "Basket total is below the minimum payment for " + asset +
                                     " (" + minimum.toString() + "), choose another asset";
                    return result;
                }
                std::cout << "[PaymentIntentBroker] Top-up raised from " << estimated.toString()
                          << " to minimum " << minimum.toString() << " " << asset << std::endl;
                payAmount = minimum;
            }

            domain::PaymentRequest paymentRequest;
            paymentRequest.orderReference = generateOrderReference(request.buyerId, request.isPurchase);
            paymentRequest.amount = payAmount;
            paymentRequest.asset = asset;
            paymentRequest.callbackUrl = callbackUrl();
            paymentRequest.description = describe(request);

            intent = processor_->createPayment(paymentRequest);
            intent.orderReference = paymentRequest.orderReference;
            intent.targetAmount = request.targetAmount;
            expected = intent.payAmount.isPositive() ? intent.payAmount : payAmount;

        } catch (const domain::PaymentProcessorException& e) {
            std::cerr << "[PaymentIntentBroker] Processor error (" << domain::toString(e.kind())
                      << ", HTTP " << e.httpStatus() << ") for buyer " << request.buyerId
                      << ": " << e.what() << std::endl;
            return fromProcessorError(e, asset);
        }

        domain::PendingSettlement record;
        record.paymentId = intent.paymentId;
        record.buyerId = request.buyerId;
        record.settlementAsset = asset;
        record.targetAmount = request.targetAmount;
        record.expectedAssetAmount = domain::Money::fromNanos(expected.totalNanos(), asset);
        record.isPurchase = request.isPurchase;
        record.snapshot = request.snapshot;
        record.discountCode = request.discountCode;
        record.state = domain::SettlementState::OPEN;
        record.createdAt = clock_->now();

        try {
            pending_->save(record);
        } catch (const std::exception& e) {
            std::cerr << "[PaymentIntentBroker] CRITICAL: payment " << intent.paymentId
                      << " opened but not recorded: " << e.what() << std::endl;
            outbox_->raiseOperatorAlert("SETTLEMENT_NOT_RECORDED", intent.paymentId,
                                        "buyer " + std::to_string(request.buyerId) + ", " +
                                        expected.toString() + " " + asset + ": " + e.what());
            result.status = domain::IntentStatus::PERSISTENCE_FAILED;
            result.message = "Payment could not be registered, please do not pay and retry";
            return result;
        }

        std::cout << "[PaymentIntentBroker] Opened " << intent.paymentId << " ("
                  << (request.isPurchase ? "purchase" : "top-up") << ") buyer " << request.buyerId
                  << ": " << expected.toString() << " " << asset << " for "
                  << request.targetAmount.toString() << " " << request.targetAmount.currency << std::endl;

        result.status = domain::IntentStatus::OPENED;
        result.intent = intent;
        result.message = "Payment created";
        return result;
    }

private:
    std::shared_ptr<ports::output::IPaymentProcessor> processor_;
    std::shared_ptr<ports::output::IPendingSettlementRepository> pending_;
    std::shared_ptr<ports::output::INotificationOutbox> outbox_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<settings::ICheckoutSettings> settings_;
    std::mt19937 rng_;
    std::mutex rngMutex_;

    std::string callbackUrl() const {
        return settings_->getWebhookUrl() + "/webhook";
    }

    /**
     * @brief BUYER<id>_<PURCHASE|TOPUP>_<epoch>_<6 hex>
     */
    std::string generateOrderReference(int64_t buyerId, bool isPurchase) {
        uint32_t suffix;
        {
            std::lock_guard<std::mutex> lock(rngMutex_);
            std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);
            suffix = dist(rng_);
        }

        std::stringstream ss;
        ss << "BUYER" << buyerId << "_" << (isPurchase ? "PURCHASE" : "TOPUP") << "_"
           << clock_->now().epochSeconds() << "_"
           << std::hex << std::setfill('0') << std::setw(6) << suffix;
        return ss.str();
    }

    static std::string describe(const domain::IntentRequest& request) {
        std::string what = request.isPurchase
            ? "Purchase of " + std::to_string(request.snapshot.items.size()) + " items"
            : "Balance top-up";
        return what + " for buyer " + std::to_string(request.buyerId) + " (~" +
               request.targetAmount.roundHalfUpCents().toString() + " " + request.targetAmount.currency + ")";
    }

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static domain::IntentResult fromProcessorError(const domain::PaymentProcessorException& e,
                                                   const std::string& asset) {
        domain::IntentResult result;
        switch (e.kind()) {
            case domain::ProcessorErrorKind::UNSUPPORTED_ASSET:
                result.status = domain::IntentStatus::UNSUPPORTED_ASSET;
                result.message = "Asset " + asset + " is not supported, choose another one";
                break;
            case domain::ProcessorErrorKind::AMOUNT_TOO_LOW:
                result.status = domain::IntentStatus::BELOW_MINIMUM;
                result.message = "Amount is below the minimum payment for " + asset;
                break;
            case domain::ProcessorErrorKind::TRANSIENT:
                result.status = domain::IntentStatus::PROCESSOR_UNAVAILABLE;
                result.message = "Payment provider is unavailable, please try again later";
                break;
            case domain::ProcessorErrorKind::INVALID_CREDENTIALS:
            case domain::ProcessorErrorKind::REQUEST_REJECTED:
            case domain::ProcessorErrorKind::INVALID_RESPONSE:
                result.status = domain::IntentStatus::PROCESSOR_REJECTED;
                result.message = "Payment could not be created, please try again later";
                break;
        }
        return result;
    }
};

} // namespace checkout::application
