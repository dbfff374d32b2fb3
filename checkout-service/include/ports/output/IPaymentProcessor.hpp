#pragma once

#include "domain/Money.hpp"
#include "domain/PaymentIntent.hpp"
#include "domain/PaymentProcessorException.hpp"
#include <string>

namespace checkout::ports::output {

/**
 * @brief Внешний платёжный процессор
 *
 * Все методы бросают domain::PaymentProcessorException.
 */
class IPaymentProcessor {
public:
    virtual ~IPaymentProcessor() = default;

    /**
     * @brief Сколько asset стоит amount в расчётной валюте
     */
    virtual domain::Money estimate(const domain::Money& amount, const std::string& asset) = 0;

    /**
     * @brief Минимальная сумма платежа в asset
     */
    virtual domain::Money minimumAmount(const std::string& asset) = 0;

    virtual domain::PaymentIntent createPayment(const domain::PaymentRequest& request) = 0;
};

} // namespace checkout::ports::output
