#pragma once

#include "Money.hpp"
#include "enums/DiscountStatus.hpp"
#include <string>

namespace checkout::domain {

/**
 * @brief Результат применения общего скидочного кода к сумме корзины
 *
 * Для любого статуса кроме APPLIED discountAmount равен нулю,
 * а finalTotal совпадает с originalTotal.
 */
struct DiscountResolution {
    DiscountStatus status = DiscountStatus::NONE;
    std::string code;
    Money originalTotal;
    Money discountAmount;
    Money finalTotal;
    std::string message;

    bool applied() const { return status == DiscountStatus::APPLIED; }
};

} // namespace checkout::domain
