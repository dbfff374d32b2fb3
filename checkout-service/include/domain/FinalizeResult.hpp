#pragma once

#include "Money.hpp"
#include "enums/FinalizeStatus.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace checkout::domain {

/**
 * @brief Данные для самовывоза купленного товара (products.pickup_text)
 */
struct PickupDetail {
    int64_t productId = 0;
    std::string name;
    std::string variant;
    std::string text;
};

class FinalizeResult {
public:
    FinalizeStatus status = FinalizeStatus::FAILED;
    int itemCount = 0;
    Money totalPaid;            ///< сумма price_paid по вставленным записям
    int64_t failedProductId = 0;
    std::vector<PickupDetail> pickups;  ///< по одной записи на купленный товар
    std::string message;

    bool success() const { return status == FinalizeStatus::SUCCESS; }
};

} // namespace checkout::domain
