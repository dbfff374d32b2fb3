#pragma once

#include "Money.hpp"
#include "Percent.hpp"
#include "Timestamp.hpp"
#include "enums/DiscountType.hpp"
#include <string>
#include <optional>

namespace checkout::domain {

/**
 * @brief Общий скидочный код
 *
 * value для PERCENTAGE содержит число процентов, для FIXED сумму в расчётной валюте.
 * Пустой maxUses означает неограниченное число использований.
 */
struct DiscountCode {
    std::string code;
    DiscountType type = DiscountType::PERCENTAGE;
    Money value;
    bool active = true;
    std::optional<int> maxUses;
    int usesCount = 0;
    std::optional<Timestamp> expiresAt;

    Percent percentage() const { return Percent(value); }
};

} // namespace checkout::domain
