#pragma once

#include "BasketEntry.hpp"
#include "DiscountResolution.hpp"
#include "Money.hpp"
#include <vector>
#include <string>
#include <optional>

namespace checkout::domain {

/**
 * @brief Корзина, как её видит покупатель: позиции, суммы и применённая скидка
 */
struct BasketView {
    std::vector<BasketEntry> items;
    Money originalTotal;
    DiscountResolution discount;
    Money finalTotal;
    int expiredReleased = 0;
    std::optional<std::string> notice;   ///< например, код перестал действовать и снят

    bool empty() const { return items.empty(); }
};

} // namespace checkout::domain
