#pragma once

#include "domain/SettlementNotification.hpp"
#include "domain/ReconcileResult.hpp"

namespace checkout::ports::input {

/**
 * @brief Обработка уведомлений процессора о статусе платежа
 */
class ISettlementReconciler {
public:
    virtual ~ISettlementReconciler() = default;
    virtual domain::ReconcileResult reconcile(const domain::SettlementNotification& notification) = 0;
};

} // namespace checkout::ports::input
