#pragma once

#include "settings/ICheckoutSettings.hpp"
#include <cstdlib>
#include <string>
#include <iostream>

namespace checkout::settings {

/**
 * @brief Бизнес-настройки из ENV
 *
 * - SETTLEMENT_CURRENCY (default: "eur")
 * - BASKET_TIMEOUT_MINUTES (default: 15; неположительное или нечисло → 15)
 * - BASKET_SWEEP_INTERVAL_SECONDS (default: 60)
 * - FEE_ADJUSTMENT (default: 1.0)
 * - MIN_TOPUP_AMOUNT (default: 1.00)
 * - WEBHOOK_URL (default: "http://localhost:8080")
 * - CHECKOUT_ADMIN_TOKEN (default: пусто, админские эндпоинты выключены)
 * - OUTBOX_MAX_ATTEMPTS (default: 3)
 */
class CheckoutSettings : public ICheckoutSettings {
public:
    CheckoutSettings() {
        if (const char* val = std::getenv("SETTLEMENT_CURRENCY")) {
            settlementCurrency_ = val;
        }
        reservationTtl_ = std::chrono::minutes(
            readPositiveInt("BASKET_TIMEOUT_MINUTES", DEFAULT_TIMEOUT_MINUTES));
        sweepInterval_ = std::chrono::seconds(
            readPositiveInt("BASKET_SWEEP_INTERVAL_SECONDS", DEFAULT_SWEEP_SECONDS));
        feeAdjustment_ = readAmount("FEE_ADJUSTMENT", "1.0", "");
        minTopUpAmount_ = readAmount("MIN_TOPUP_AMOUNT", "1.00", settlementCurrency_);
        if (const char* val = std::getenv("WEBHOOK_URL")) {
            webhookUrl_ = val;
        }
        if (const char* val = std::getenv("CHECKOUT_ADMIN_TOKEN")) {
            adminToken_ = val;
        }
        outboxMaxAttempts_ = readPositiveInt("OUTBOX_MAX_ATTEMPTS", 3);
    }

    std::string getSettlementCurrency() const override { return settlementCurrency_; }
    std::chrono::seconds getReservationTtl() const override { return reservationTtl_; }
    std::chrono::seconds getSweepInterval() const override { return sweepInterval_; }
    domain::Money getFeeAdjustment() const override { return feeAdjustment_; }
    domain::Money getMinTopUpAmount() const override { return minTopUpAmount_; }
    std::string getWebhookUrl() const override { return webhookUrl_; }
    std::string getAdminToken() const override { return adminToken_; }
    int getOutboxMaxAttempts() const override { return outboxMaxAttempts_; }

private:
    static constexpr int DEFAULT_TIMEOUT_MINUTES = 15;
    static constexpr int DEFAULT_SWEEP_SECONDS = 60;

    std::string settlementCurrency_ = "eur";
    std::chrono::seconds reservationTtl_{DEFAULT_TIMEOUT_MINUTES * 60};
    std::chrono::seconds sweepInterval_{DEFAULT_SWEEP_SECONDS};
    domain::Money feeAdjustment_;
    domain::Money minTopUpAmount_;
    std::string webhookUrl_ = "http://localhost:8080";
    std::string adminToken_;
    int outboxMaxAttempts_ = 3;

    static int readPositiveInt(const char* name, int fallback) {
        const char* val = std::getenv(name);
        if (!val) return fallback;
        try {
            size_t used = 0;
            int parsed = std::stoi(val, &used);
            if (used == std::string(val).size() && parsed > 0) {
                return parsed;
            }
        } catch (const std::exception&) {
        }
        std::cerr << "[CheckoutSettings] Invalid " << name << "='" << val
                  << "', using " << fallback << std::endl;
        return fallback;
    }

    static domain::Money readAmount(const char* name, const char* fallback, const std::string& currency) {
        const char* val = std::getenv(name);
        if (val) {
            try {
                auto parsed = domain::Money::parse(val, currency);
                if (parsed.isPositive()) return parsed;
            } catch (const std::invalid_argument&) {
            }
            std::cerr << "[CheckoutSettings] Invalid " << name << "='" << val
                      << "', using " << fallback << std::endl;
        }
        return domain::Money::parse(fallback, currency);
    }
};

} // namespace checkout::settings
