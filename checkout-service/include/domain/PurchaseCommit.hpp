#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace checkout::domain {

struct PurchaseLine {
    int64_t productId = 0;
    std::string name;
    std::string category;
    std::string variant;
    std::string location;
    Money pricePaid;
};

/**
 * @brief Всё, что финализация покупки применяет одной транзакцией
 *
 * settlementPaymentId задан для оплаты криптой: запись о расчёте удаляется
 * в той же транзакции. balanceDebit задан для оплаты с баланса.
 */
struct PurchaseCommit {
    int64_t buyerId = 0;
    std::vector<PurchaseLine> lines;
    std::optional<std::string> discountCode;
    std::optional<std::string> settlementPaymentId;
    std::optional<Money> balanceDebit;
    Timestamp at;
};

} // namespace checkout::domain
