#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/BasketView.hpp"
#include "domain/PaymentIntent.hpp"
#include "domain/PurchaseRecord.hpp"
#include "domain/DiscountResolution.hpp"
#include "domain/enums/IntentStatus.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace checkout::adapters::primary {

// Суммы отдаются строками, без перевода в double
inline std::string money(const domain::Money& m) {
    return m.toString();
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

/**
 * @brief buyerId, положенный BuyerIdExtractorMiddleware
 */
inline std::optional<int64_t> buyerIdOf(IRequest& req) {
    auto value = req.getAttribute("buyerId");
    if (!value || value->empty()) {
        return std::nullopt;
    }
    try {
        return std::stoll(*value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

inline nlohmann::json discountToJson(const domain::DiscountResolution& d) {
    nlohmann::json j;
    j["status"] = domain::toString(d.status);
    j["code"] = d.code;
    j["original_total"] = money(d.originalTotal);
    j["discount_amount"] = money(d.discountAmount);
    j["final_total"] = money(d.finalTotal);
    if (!d.message.empty()) {
        j["message"] = d.message;
    }
    return j;
}

inline nlohmann::json basketToJson(const domain::BasketView& basket) {
    nlohmann::json j;
    j["items"] = nlohmann::json::array();
    for (const auto& item : basket.items) {
        nlohmann::json e;
        e["entry_id"] = item.entryId;
        e["product_id"] = item.productId;
        e["name"] = item.name;
        e["category"] = item.category;
        e["variant"] = item.variant;
        e["location"] = item.location;
        e["price"] = money(item.reservedPrice);
        e["reserved_at"] = item.reservedAt.toString();
        j["items"].push_back(e);
    }
    j["original_total"] = money(basket.originalTotal);
    j["final_total"] = money(basket.finalTotal);
    j["currency"] = basket.originalTotal.currency;
    if (basket.discount.status != domain::DiscountStatus::NONE) {
        j["discount"] = discountToJson(basket.discount);
    }
    if (basket.expiredReleased > 0) {
        j["expired_released"] = basket.expiredReleased;
    }
    if (basket.notice) {
        j["notice"] = *basket.notice;
    }
    return j;
}

inline nlohmann::json intentToJson(const domain::PaymentIntent& intent) {
    nlohmann::json j;
    j["payment_id"] = intent.paymentId;
    j["pay_address"] = intent.payAddress;
    j["pay_amount"] = money(intent.payAmount);
    j["pay_currency"] = intent.payCurrency;
    j["expires_at"] = intent.expiresAt;
    j["order_reference"] = intent.orderReference;
    j["target_amount"] = money(intent.targetAmount);
    return j;
}

inline nlohmann::json purchaseToJson(const domain::PurchaseRecord& p) {
    nlohmann::json j;
    j["id"] = p.id;
    j["product_id"] = p.productId;
    j["product_name"] = p.productName;
    j["category"] = p.category;
    j["variant"] = p.variant;
    j["price_paid"] = money(p.pricePaid);
    j["location"] = p.location;
    j["purchased_at"] = p.purchasedAt.toString();
    return j;
}

/**
 * @brief HTTP статус для неудачи открытия платежа
 *
 * Ошибки выбора покупателя (актив, сумма) дают 422, сбои процессора 502.
 */
inline int intentHttpStatus(domain::IntentStatus status) {
    switch (status) {
        case domain::IntentStatus::OPENED: return 201;
        case domain::IntentStatus::BELOW_MINIMUM: return 422;
        case domain::IntentStatus::UNSUPPORTED_ASSET: return 422;
        case domain::IntentStatus::INVALID_QUOTE: return 502;
        case domain::IntentStatus::PROCESSOR_UNAVAILABLE: return 503;
        case domain::IntentStatus::PROCESSOR_REJECTED: return 502;
        case domain::IntentStatus::PERSISTENCE_FAILED: return 500;
    }
    return 500;
}

} // namespace checkout::adapters::primary
