#pragma once

#include "domain/CheckoutResult.hpp"
#include "domain/IntentResult.hpp"
#include "domain/PurchaseRecord.hpp"
#include "domain/enums/CheckoutMethod.hpp"
#include "domain/Money.hpp"
#include <vector>
#include <string>
#include <cstdint>

namespace checkout::ports::input {

/**
 * @brief Интерфейс оформления заказа и пополнения баланса
 */
class ICheckoutService {
public:
    virtual ~ICheckoutService() = default;

    /**
     * @brief Оформить текущую корзину
     * @param asset Актив для CRYPTO, для BALANCE игнорируется
     */
    virtual domain::CheckoutResult checkout(int64_t buyerId,
                                            domain::CheckoutMethod method,
                                            const std::string& asset) = 0;

    /**
     * @brief Открыть платёж на пополнение баланса
     */
    virtual domain::IntentResult openTopUp(int64_t buyerId,
                                           const domain::Money& amount,
                                           const std::string& asset) = 0;

    virtual domain::Money balance(int64_t buyerId) = 0;

    virtual std::vector<domain::PurchaseRecord> purchaseHistory(int64_t buyerId, int limit) = 0;
};

} // namespace checkout::ports::input
