#pragma once

#include "Money.hpp"
#include <string>

namespace checkout::domain {

/**
 * @brief Запрос на создание платежа у процессора
 */
struct PaymentRequest {
    std::string orderReference;
    Money amount;               ///< в активе платежа
    std::string asset;
    std::string callbackUrl;
    std::string description;
};

/**
 * @brief Открытое платёжное намерение, как его вернул процессор
 */
struct PaymentIntent {
    std::string paymentId;
    std::string payAddress;
    Money payAmount;
    std::string payCurrency;
    std::string expiresAt;
    std::string orderReference;
    Money targetAmount;         ///< в расчётной валюте
};

} // namespace checkout::domain
