#pragma once

#include "domain/DiscountCode.hpp"
#include "domain/DiscountResolution.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <string>

namespace checkout::application {

/**
 * @brief Применение общего скидочного кода к сумме корзины
 *
 * Чистая функция: результат зависит только от аргументов. Вызывается заново
 * при каждом изменении корзины, старая скидка никогда не переиспользуется.
 */
class DiscountResolver {
public:
    /**
     * @param originalTotal текущая сумма корзины
     * @param requestedCode код, который ввёл покупатель (пустой = без кода)
     * @param code найденная запись кода, nullopt если такого кода нет
     * @param now текущее время (UTC)
     */
    static domain::DiscountResolution resolve(
        const domain::Money& originalTotal,
        const std::string& requestedCode,
        const std::optional<domain::DiscountCode>& code,
        const domain::Timestamp& now)
    {
        domain::DiscountResolution r;
        r.code = requestedCode;
        r.originalTotal = originalTotal;
        r.discountAmount = domain::Money::zero(originalTotal.currency);
        r.finalTotal = originalTotal;

        if (requestedCode.empty()) {
            r.status = domain::DiscountStatus::NONE;
            return r;
        }
        if (!code) {
            r.status = domain::DiscountStatus::NOT_FOUND;
            r.message = "Discount code not found";
            return r;
        }
        if (!code->active) {
            r.status = domain::DiscountStatus::INACTIVE;
            r.message = "Discount code is not active";
            return r;
        }
        if (code->expiresAt && *code->expiresAt <= now) {
            r.status = domain::DiscountStatus::EXPIRED;
            r.message = "Discount code expired at " + code->expiresAt->toString();
            return r;
        }
        if (code->maxUses && code->usesCount >= *code->maxUses) {
            r.status = domain::DiscountStatus::EXHAUSTED;
            r.message = "Discount code usage limit reached";
            return r;
        }

        domain::Money discount;
        if (code->type == domain::DiscountType::PERCENTAGE) {
            discount = code->percentage().applyTo(originalTotal).roundHalfUpCents();
        } else {
            discount = domain::Money::fromNanos(code->value.totalNanos(), originalTotal.currency);
        }
        if (discount > originalTotal) {
            discount = originalTotal;
        }
        if (discount < domain::Money::zero()) {
            discount = domain::Money::zero(originalTotal.currency);
        }

        r.status = domain::DiscountStatus::APPLIED;
        r.discountAmount = discount;
        r.finalTotal = originalTotal - discount;
        r.message = "Discount " + code->code + " applied";
        return r;
    }

    /**
     * @brief Цена позиции после скидки реселлера: price - round_half_up(price * pct / 100)
     */
    static domain::Money resellerPrice(const domain::Money& catalogPrice, const domain::Percent& pct) {
        if (!pct.isPositive()) {
            return catalogPrice;
        }
        auto reduction = pct.applyTo(catalogPrice).roundHalfUpCents();
        if (reduction > catalogPrice) {
            reduction = catalogPrice;
        }
        return catalogPrice - reduction;
    }
};

} // namespace checkout::application
