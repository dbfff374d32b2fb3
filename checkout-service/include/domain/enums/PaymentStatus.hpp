#pragma once

#include <string>

namespace checkout::domain {

/**
 * @brief Статус платежа у процессора, сведённый к трём классам
 *
 * finished / confirmed / partially_paid → PAID
 * failed / expired / refunded → FAILED
 * всё остальное (waiting, confirming, sending, ...) → IN_PROGRESS
 */
enum class PaymentStatus {
    PAID,
    FAILED,
    IN_PROGRESS
};

inline PaymentStatus classifyPaymentStatus(const std::string& status) {
    if (status == "finished" || status == "confirmed" || status == "partially_paid") {
        return PaymentStatus::PAID;
    }
    if (status == "failed" || status == "expired" || status == "refunded") {
        return PaymentStatus::FAILED;
    }
    return PaymentStatus::IN_PROGRESS;
}

inline std::string toString(PaymentStatus status) {
    switch (status) {
        case PaymentStatus::PAID: return "PAID";
        case PaymentStatus::FAILED: return "FAILED";
        case PaymentStatus::IN_PROGRESS: return "IN_PROGRESS";
        default: return "UNKNOWN";
    }
}

} // namespace checkout::domain
