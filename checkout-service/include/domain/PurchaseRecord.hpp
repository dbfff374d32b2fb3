#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace checkout::domain {

/**
 * @brief Запись журнала покупок, после вставки не меняется
 */
struct PurchaseRecord {
    int64_t id = 0;
    int64_t buyerId = 0;
    int64_t productId = 0;
    std::string productName;
    std::string category;
    std::string variant;
    Money pricePaid;
    std::string location;
    Timestamp purchasedAt;
};

} // namespace checkout::domain
