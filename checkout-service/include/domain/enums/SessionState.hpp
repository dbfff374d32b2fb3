#pragma once

#include <string>

namespace checkout::domain {

/**
 * @brief Чего чат-сессия покупателя ждёт от следующего текстового сообщения
 */
enum class SessionState {
    IDLE,
    AWAITING_DISCOUNT_CODE,
    AWAITING_TOPUP_AMOUNT,
    AWAITING_TOPUP_ASSET
};

inline std::string toString(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "IDLE";
        case SessionState::AWAITING_DISCOUNT_CODE: return "AWAITING_DISCOUNT_CODE";
        case SessionState::AWAITING_TOPUP_AMOUNT: return "AWAITING_TOPUP_AMOUNT";
        case SessionState::AWAITING_TOPUP_ASSET: return "AWAITING_TOPUP_ASSET";
    }
    return "UNKNOWN";
}

} // namespace checkout::domain
