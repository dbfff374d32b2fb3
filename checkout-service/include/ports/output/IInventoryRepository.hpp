#pragma once

#include "domain/ProductSelector.hpp"
#include "domain/BasketEntry.hpp"
#include "domain/BasketSnapshot.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <vector>
#include <cstdint>

namespace checkout::ports::output {

/**
 * @brief Склад и корзины покупателей
 *
 * Каждая мутирующая операция атомарна: счётчик reserved и строка корзины
 * меняются в одной транзакции под эксклюзивной блокировкой строки товара.
 */
class IInventoryRepository {
public:
    virtual ~IInventoryRepository() = default;

    /**
     * @brief Зарезервировать одну единицу под селектор
     *
     * Выбор кандидата (available > reserved, наименьший id), reserved + 1
     * и вставка строки корзины выполняются атомарно.
     * @return строка корзины, либо nullopt если подходящих единиц нет
     */
    virtual std::optional<domain::BasketEntry> reserveUnit(
        int64_t buyerId,
        const domain::ProductSelector& selector,
        const domain::Timestamp& now) = 0;

    /**
     * @brief Убрать из корзины одну строку с productId и снять её резерв
     * @return false если такой строки в корзине нет
     */
    virtual bool releaseEntry(int64_t buyerId, int64_t productId) = 0;

    /**
     * @brief Очистить корзину, сняв все её резервы
     * @return число снятых резервов
     */
    virtual int clearBasket(int64_t buyerId) = 0;

    virtual std::vector<domain::BasketEntry> getBasket(int64_t buyerId) = 0;

    /**
     * @brief Снять все резервы с reservedAt <= cutoff (по одной строке на транзакцию)
     */
    virtual int releaseExpired(const domain::Timestamp& cutoff) = 0;

    virtual int releaseExpiredForBuyer(int64_t buyerId, const domain::Timestamp& cutoff) = 0;
};

} // namespace checkout::ports::output
