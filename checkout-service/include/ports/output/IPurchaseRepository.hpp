#pragma once

#include "domain/PurchaseCommit.hpp"
#include "domain/PurchaseRecord.hpp"
#include "domain/FinalizeResult.hpp"
#include <vector>
#include <cstdint>

namespace checkout::ports::output {

class IPurchaseRepository {
public:
    virtual ~IPurchaseRepository() = default;

    /**
     * @brief Применить покупку целиком или не применить ничего
     *
     * Для каждой строки: если в корзине есть резерв на товар, он потребляется
     * (reserved - 1, available - 1), иначе нужен свободный остаток
     * (available > reserved). Затем записи в журнал, total_purchases,
     * счётчик использований кода, списание баланса и удаление записи
     * о расчёте. Любая неудача откатывает всю транзакцию.
     *
     * @throws std::exception при недоступности хранилища
     */
    virtual domain::FinalizeResult commitPurchase(const domain::PurchaseCommit& commit) = 0;

    /**
     * @brief Последние покупки, новые первыми
     */
    virtual std::vector<domain::PurchaseRecord> history(int64_t buyerId, int limit) = 0;
};

} // namespace checkout::ports::output
