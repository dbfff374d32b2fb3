#pragma once

#include "Money.hpp"
#include "PaymentIntent.hpp"
#include "enums/CheckoutStatus.hpp"
#include "enums/IntentStatus.hpp"
#include <string>
#include <optional>

namespace checkout::domain {

class CheckoutResult {
public:
    CheckoutStatus status = CheckoutStatus::FAILED;
    Money originalTotal;
    Money discountAmount;
    Money finalTotal;
    int itemCount = 0;
    std::optional<PaymentIntent> intent;
    std::optional<IntentStatus> intentStatus;   ///< подробность для PAYMENT_FAILED
    std::string message;
};

} // namespace checkout::domain
