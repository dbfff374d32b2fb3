#pragma once

#include <string>

namespace checkout::domain {

/**
 * @brief Чем закончилась обработка уведомления о платеже
 *
 * Все исходы, кроме DATASTORE_UNAVAILABLE, подтверждаются отправителю кодом 200.
 */
enum class ReconcileOutcome {
    UNKNOWN_PAYMENT,        ///< записи нет: уже обработано или никогда не существовало
    IGNORED_CHILD,          ///< дочерний платёж (parent_payment_id)
    IGNORED_STATUS,         ///< промежуточный статус, запись остаётся OPEN
    IGNORED_ZERO_AMOUNT,    ///< actually_paid <= 0, запись остаётся OPEN
    AWAITING_OPERATOR,      ///< запись уже помечена ATTENTION_REQUIRED
    FINALIZED,
    CREDITED,
    ZERO_CREDIT_CLOSED,     ///< кредит после округления равен нулю, запись закрыта
    UNDERPAID_RELEASED,
    FAILED_RELEASED,
    FINALIZATION_FAILED,    ///< критично: деньги получены, товар не выдан
    ASSET_MISMATCH,         ///< критично: оплачено не тем активом
    INVALID_QUOTE,          ///< критично: ожидаемая сумма пополнения равна нулю
    DATASTORE_UNAVAILABLE
};

inline std::string toString(ReconcileOutcome outcome) {
    switch (outcome) {
        case ReconcileOutcome::UNKNOWN_PAYMENT: return "UNKNOWN_PAYMENT";
        case ReconcileOutcome::IGNORED_CHILD: return "IGNORED_CHILD";
        case ReconcileOutcome::IGNORED_STATUS: return "IGNORED_STATUS";
        case ReconcileOutcome::IGNORED_ZERO_AMOUNT: return "IGNORED_ZERO_AMOUNT";
        case ReconcileOutcome::AWAITING_OPERATOR: return "AWAITING_OPERATOR";
        case ReconcileOutcome::FINALIZED: return "FINALIZED";
        case ReconcileOutcome::CREDITED: return "CREDITED";
        case ReconcileOutcome::ZERO_CREDIT_CLOSED: return "ZERO_CREDIT_CLOSED";
        case ReconcileOutcome::UNDERPAID_RELEASED: return "UNDERPAID_RELEASED";
        case ReconcileOutcome::FAILED_RELEASED: return "FAILED_RELEASED";
        case ReconcileOutcome::FINALIZATION_FAILED: return "FINALIZATION_FAILED";
        case ReconcileOutcome::ASSET_MISMATCH: return "ASSET_MISMATCH";
        case ReconcileOutcome::INVALID_QUOTE: return "INVALID_QUOTE";
        case ReconcileOutcome::DATASTORE_UNAVAILABLE: return "DATASTORE_UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

} // namespace checkout::domain
