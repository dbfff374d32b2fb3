#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace checkout::domain {

/**
 * @brief Одна резервация в корзине покупателя
 */
struct BasketEntry {
    int64_t entryId = 0;
    int64_t productId = 0;
    std::string name;
    std::string category;
    std::string variant;
    std::string location;
    Money reservedPrice;
    Timestamp reservedAt;
};

} // namespace checkout::domain
