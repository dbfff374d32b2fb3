#pragma once

#include "Money.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace checkout::domain {

struct SnapshotItem {
    int64_t productId = 0;
    std::string name;
    std::string category;
    std::string variant;
    std::string location;
    Money catalogPrice;
    Money discountedPrice;   ///< цена после скидки реселлера на момент оформления
};

/**
 * @brief Неизменяемая копия корзины, сохранённая вместе с платёжным намерением
 *
 * Хранится в pending_settlements как JSON с полем version.
 */
struct BasketSnapshot {
    static constexpr int CURRENT_VERSION = 1;

    int version = CURRENT_VERSION;
    std::vector<SnapshotItem> items;

    bool empty() const { return items.empty(); }

    Money total() const {
        Money sum;
        for (const auto& item : items) {
            sum += item.catalogPrice;
        }
        return sum;
    }
};

} // namespace checkout::domain
