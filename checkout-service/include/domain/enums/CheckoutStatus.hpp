#pragma once

#include <string>

namespace checkout::domain {

enum class CheckoutStatus {
    COMPLETED,
    PAYMENT_PENDING,
    EMPTY_BASKET,
    INSUFFICIENT_BALANCE,
    INVALID_REQUEST,
    DISCOUNT_REJECTED,
    PAYMENT_FAILED,
    FAILED
};

inline std::string toString(CheckoutStatus status) {
    switch (status) {
        case CheckoutStatus::COMPLETED: return "COMPLETED";
        case CheckoutStatus::PAYMENT_PENDING: return "PAYMENT_PENDING";
        case CheckoutStatus::EMPTY_BASKET: return "EMPTY_BASKET";
        case CheckoutStatus::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case CheckoutStatus::INVALID_REQUEST: return "INVALID_REQUEST";
        case CheckoutStatus::DISCOUNT_REJECTED: return "DISCOUNT_REJECTED";
        case CheckoutStatus::PAYMENT_FAILED: return "PAYMENT_FAILED";
        case CheckoutStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace checkout::domain
