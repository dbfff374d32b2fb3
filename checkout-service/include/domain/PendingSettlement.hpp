#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "BasketSnapshot.hpp"
#include "enums/SettlementState.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace checkout::domain {

/**
 * @brief Что должно произойти, когда платёж paymentId завершится
 *
 * targetAmount в расчётной валюте (после всех скидок),
 * expectedAssetAmount в активе платежа.
 */
struct PendingSettlement {
    std::string paymentId;
    int64_t buyerId = 0;
    std::string settlementAsset;
    Money targetAmount;
    Money expectedAssetAmount;
    bool isPurchase = false;
    BasketSnapshot snapshot;
    std::optional<std::string> discountCode;
    SettlementState state = SettlementState::OPEN;
    Timestamp createdAt;
};

} // namespace checkout::domain
