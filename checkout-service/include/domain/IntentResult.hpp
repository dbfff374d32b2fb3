#pragma once

#include "Money.hpp"
#include "BasketSnapshot.hpp"
#include "PaymentIntent.hpp"
#include "enums/IntentStatus.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace checkout::domain {

/**
 * @brief Что нужно оплатить через процессор
 *
 * Для пополнения баланса isPurchase = false, snapshot пустой.
 */
struct IntentRequest {
    int64_t buyerId = 0;
    Money targetAmount;
    std::string asset;
    bool isPurchase = false;
    BasketSnapshot snapshot;
    std::optional<std::string> discountCode;
};

class IntentResult {
public:
    IntentStatus status = IntentStatus::PROCESSOR_UNAVAILABLE;
    std::optional<PaymentIntent> intent;
    std::string message;

    bool opened() const { return status == IntentStatus::OPENED; }
};

} // namespace checkout::domain
