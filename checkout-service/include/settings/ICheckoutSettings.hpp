#pragma once

#include "domain/Money.hpp"
#include <chrono>
#include <string>

namespace checkout::settings {

/**
 * @brief Бизнес-настройки оформления заказа
 */
class ICheckoutSettings {
public:
    virtual ~ICheckoutSettings() = default;

    virtual std::string getSettlementCurrency() const = 0;
    virtual std::chrono::seconds getReservationTtl() const = 0;
    virtual std::chrono::seconds getSweepInterval() const = 0;

    /**
     * @brief Множитель зачисления при пополнении (1.0 = без комиссии)
     */
    virtual domain::Money getFeeAdjustment() const = 0;

    virtual domain::Money getMinTopUpAmount() const = 0;

    /**
     * @brief Базовый URL сервиса; callback процессора = getWebhookUrl() + "/webhook"
     */
    virtual std::string getWebhookUrl() const = 0;

    virtual std::string getAdminToken() const = 0;
    virtual int getOutboxMaxAttempts() const = 0;
};

} // namespace checkout::settings
