#pragma once

#include "Money.hpp"
#include <string>
#include <optional>

namespace checkout::domain {

/**
 * @brief Уведомление процессора о статусе платежа (IPN)
 */
struct SettlementNotification {
    std::string paymentId;
    std::string paymentStatus;
    std::string payCurrency;
    Money actuallyPaid;
    std::optional<std::string> parentPaymentId;
};

} // namespace checkout::domain
