#pragma once

#include "ports/input/IChatSessionService.hpp"
#include "ports/input/IReservationService.hpp"
#include "ports/input/ICheckoutService.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "application/SessionRegistry.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>

namespace checkout::application {

/**
 * @brief Автомат чат-сессии покупателя
 *
 * Кнопки фронтенда переводят сессию в состояние ожидания (enter),
 * следующий текст покупателя разбирается обработчиком этого состояния.
 *
 *   IDLE --apply_discount--> AWAITING_DISCOUNT_CODE --код--> IDLE
 *   IDLE --top_up--> AWAITING_TOPUP_AMOUNT --сумма--> AWAITING_TOPUP_ASSET --актив--> IDLE
 *   любое --cancel--> IDLE
 */
class ChatSessionService : public ports::input::IChatSessionService {
public:
    static constexpr const char* MAX_TOPUP_AMOUNT = "10000";

    ChatSessionService(
        std::shared_ptr<ports::input::IReservationService> reservations,
        std::shared_ptr<ports::input::ICheckoutService> checkout,
        std::shared_ptr<SessionRegistry> sessions,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : reservations_(std::move(reservations))
      , checkout_(std::move(checkout))
      , sessions_(std::move(sessions))
      , settings_(std::move(settings))
    {
        std::cout << "[ChatSessionService] Created" << std::endl;
    }

    domain::ChatReply handleMessage(int64_t buyerId, const std::string& text) override {
        auto session = sessions_->session(buyerId);
        std::lock_guard<std::mutex> chatLock(session->chatMutex);

        std::string trimmed = trim(text);
        auto current = stateOf(*session);

        switch (current) {
            case domain::SessionState::IDLE:
                return onIdle(*session);
            case domain::SessionState::AWAITING_DISCOUNT_CODE:
                return onDiscountCode(buyerId, *session, trimmed);
            case domain::SessionState::AWAITING_TOPUP_AMOUNT:
                return onTopUpAmount(*session, trimmed);
            case domain::SessionState::AWAITING_TOPUP_ASSET:
                return onTopUpAsset(buyerId, *session, trimmed);
        }
        return onIdle(*session);
    }

    domain::ChatReply enter(int64_t buyerId, const std::string& action) override {
        auto session = sessions_->session(buyerId);
        std::lock_guard<std::mutex> chatLock(session->chatMutex);

        if (action == "apply_discount") {
            moveTo(*session, domain::SessionState::AWAITING_DISCOUNT_CODE, std::nullopt);
            return reply(domain::SessionState::AWAITING_DISCOUNT_CODE, "Send your discount code.");
        }
        if (action == "top_up") {
            moveTo(*session, domain::SessionState::AWAITING_TOPUP_AMOUNT, std::nullopt);
            return reply(domain::SessionState::AWAITING_TOPUP_AMOUNT,
                         "How much do you want to top up? Minimum " +
                         settings_->getMinTopUpAmount().toString() + " " +
                         settings_->getSettlementCurrency() + ".");
        }
        if (action == "cancel") {
            moveTo(*session, domain::SessionState::IDLE, std::nullopt);
            return reply(domain::SessionState::IDLE, "Cancelled.");
        }

        auto r = reply(stateOf(*session), "Unknown action: " + action);
        r.accepted = false;
        return r;
    }

    domain::SessionState state(int64_t buyerId) const override {
        return stateOf(*sessions_->session(buyerId));
    }

private:
    std::shared_ptr<ports::input::IReservationService> reservations_;
    std::shared_ptr<ports::input::ICheckoutService> checkout_;
    std::shared_ptr<SessionRegistry> sessions_;
    std::shared_ptr<settings::ICheckoutSettings> settings_;

    static domain::SessionState stateOf(BuyerSession& session) {
        std::lock_guard<std::mutex> lock(session.mutex);
        return session.state;
    }

    static void moveTo(BuyerSession& session,
                       domain::SessionState next,
                       const std::optional<domain::Money>& topUpAmount) {
        std::lock_guard<std::mutex> lock(session.mutex);
        session.state = next;
        session.pendingTopUpAmount = topUpAmount;
    }

    static domain::ChatReply reply(domain::SessionState state, const std::string& text) {
        domain::ChatReply r;
        r.state = state;
        r.text = text;
        return r;
    }

    static domain::ChatReply rejected(domain::SessionState state, const std::string& text) {
        auto r = reply(state, text);
        r.accepted = false;
        return r;
    }

    static std::string trim(const std::string& s) {
        auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    domain::ChatReply onIdle(BuyerSession&) {
        return rejected(domain::SessionState::IDLE, "Please use the menu buttons.");
    }

    domain::ChatReply onDiscountCode(int64_t buyerId, BuyerSession& session, const std::string& code) {
        moveTo(session, domain::SessionState::IDLE, std::nullopt);

        if (code.empty()) {
            return rejected(domain::SessionState::IDLE, "No code entered. Returning to basket.");
        }

        auto basket = reservations_->viewBasket(buyerId);
        if (basket.empty()) {
            return rejected(domain::SessionState::IDLE, "Basket is empty. Cannot apply a code.");
        }

        auto resolution = reservations_->applyDiscount(buyerId, code);
        if (!resolution.applied()) {
            return rejected(domain::SessionState::IDLE, resolution.message);
        }
        return reply(domain::SessionState::IDLE,
                     "Code " + code + " applied: -" + resolution.discountAmount.toString() +
                     ", new total " + resolution.finalTotal.toString() + " " +
                     resolution.finalTotal.currency + ".");
    }

    domain::ChatReply onTopUpAmount(BuyerSession& session, const std::string& text) {
        std::string normalized = text;
        std::replace(normalized.begin(), normalized.end(), ',', '.');

        domain::Money amount;
        try {
            amount = domain::Money::parse(normalized, settings_->getSettlementCurrency());
        } catch (const std::invalid_argument&) {
            return rejected(domain::SessionState::AWAITING_TOPUP_AMOUNT,
                            "Invalid amount format (e.g. 10.50).");
        }

        auto minimum = settings_->getMinTopUpAmount();
        if (amount < minimum) {
            return rejected(domain::SessionState::AWAITING_TOPUP_AMOUNT,
                            "Amount too low. Minimum " + minimum.toString() + " " +
                            settings_->getSettlementCurrency() + ".");
        }
        if (amount > domain::Money::parse(MAX_TOPUP_AMOUNT)) {
            return rejected(domain::SessionState::AWAITING_TOPUP_AMOUNT,
                            std::string("Amount too high. Maximum ") + MAX_TOPUP_AMOUNT + " " +
                            settings_->getSettlementCurrency() + ".");
        }

        auto rounded = amount.roundDownCents();
        moveTo(session, domain::SessionState::AWAITING_TOPUP_ASSET, rounded);
        return reply(domain::SessionState::AWAITING_TOPUP_ASSET,
                     "Top up " + rounded.toString() + " " + settings_->getSettlementCurrency() +
                     ". Which crypto asset will you pay with?");
    }

    domain::ChatReply onTopUpAsset(int64_t buyerId, BuyerSession& session, const std::string& asset) {
        std::optional<domain::Money> amount;
        {
            std::lock_guard<std::mutex> lock(session.mutex);
            amount = session.pendingTopUpAmount;
        }
        if (!amount) {
            moveTo(session, domain::SessionState::IDLE, std::nullopt);
            return rejected(domain::SessionState::IDLE, "Top-up expired, please start again.");
        }
        if (asset.empty()) {
            return rejected(domain::SessionState::AWAITING_TOPUP_ASSET, "Send the asset code, e.g. btc.");
        }

        moveTo(session, domain::SessionState::IDLE, std::nullopt);
        auto opened = checkout_->openTopUp(buyerId, *amount, asset);
        if (!opened.opened()) {
            std::cout << "[ChatSessionService] Top-up for buyer " << buyerId << " not opened: "
                      << domain::toString(opened.status) << std::endl;
            return rejected(domain::SessionState::IDLE, opened.message);
        }

        auto r = reply(domain::SessionState::IDLE,
                       "Send " + opened.intent->payAmount.toString() + " " + opened.intent->payCurrency +
                       " to " + opened.intent->payAddress + ". Your balance is credited once the payment confirms.");
        r.intent = opened.intent;
        return r;
    }
};

} // namespace checkout::application
