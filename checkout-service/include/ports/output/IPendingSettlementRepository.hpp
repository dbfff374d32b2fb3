#pragma once

#include "domain/PendingSettlement.hpp"
#include <optional>
#include <string>

namespace checkout::ports::output {

class IPendingSettlementRepository {
public:
    virtual ~IPendingSettlementRepository() = default;

    virtual void save(const domain::PendingSettlement& record) = 0;

    virtual std::optional<domain::PendingSettlement> find(const std::string& paymentId) = 0;

    /**
     * @brief Удалить запись и, если releaseSnapshot, снять резервы позиций снимка
     *
     * Снимаются только резервы, которые ещё лежат в корзине покупателя,
     * поэтому повторное снятие ничего не меняет.
     * @return false если записи уже нет
     */
    virtual bool closeAndRelease(const std::string& paymentId, bool releaseSnapshot) = 0;

    /**
     * @brief Оставить запись и пометить её для ручного разбора
     */
    virtual void markAttentionRequired(const std::string& paymentId, const std::string& reason) = 0;
};

} // namespace checkout::ports::output
