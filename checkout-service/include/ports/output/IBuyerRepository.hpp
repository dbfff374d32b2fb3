#pragma once

#include "domain/Money.hpp"
#include <string>
#include <cstdint>

namespace checkout::ports::output {

class IBuyerRepository {
public:
    virtual ~IBuyerRepository() = default;

    virtual domain::Money getBalance(int64_t buyerId) = 0;

    /**
     * @brief Зачислить пополнение и закрыть запись о расчёте одной транзакцией
     * @return false если записи paymentId уже нет (повторная доставка)
     */
    virtual bool creditSettlement(const std::string& paymentId, int64_t buyerId, const domain::Money& amount) = 0;
};

} // namespace checkout::ports::output
