#pragma once

#include "domain/ProductSelector.hpp"
#include "domain/ReservationResult.hpp"
#include "domain/BasketView.hpp"
#include "domain/DiscountResolution.hpp"
#include <string>
#include <cstdint>

namespace checkout::ports::input {

/**
 * @brief Интерфейс корзины покупателя
 *
 * Каждая мутация и каждый просмотр перепроверяют применённый скидочный код
 * против текущей суммы корзины.
 */
class IReservationService {
public:
    virtual ~IReservationService() = default;

    /**
     * @brief Зарезервировать единицу товара и положить её в корзину
     */
    virtual domain::ReservationResult reserve(int64_t buyerId, const domain::ProductSelector& selector) = 0;

    /**
     * @brief Убрать позицию из корзины и снять её резерв
     */
    virtual bool removeItem(int64_t buyerId, int64_t productId) = 0;

    /**
     * @brief Отмена покупателем: снять все резервы корзины
     *
     * Открытые платёжные намерения не затрагиваются.
     */
    virtual int clearBasket(int64_t buyerId) = 0;

    /**
     * @brief Показать корзину, предварительно сняв просроченные резервы
     */
    virtual domain::BasketView viewBasket(int64_t buyerId) = 0;

    virtual domain::DiscountResolution applyDiscount(int64_t buyerId, const std::string& code) = 0;

    virtual void removeDiscount(int64_t buyerId) = 0;
};

} // namespace checkout::ports::input
