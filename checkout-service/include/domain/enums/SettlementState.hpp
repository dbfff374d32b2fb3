#pragma once

#include <string>

namespace checkout::domain {

/**
 * @brief Состояние записи об ожидаемом расчёте
 *
 * Закрытая запись удаляется, поэтому состояния CLOSED здесь нет.
 * ATTENTION_REQUIRED: деньги получены, но товар не выдан, нужен оператор.
 */
enum class SettlementState {
    OPEN,
    ATTENTION_REQUIRED
};

inline std::string toString(SettlementState state) {
    switch (state) {
        case SettlementState::OPEN: return "OPEN";
        case SettlementState::ATTENTION_REQUIRED: return "ATTENTION_REQUIRED";
        default: return "UNKNOWN";
    }
}

inline SettlementState parseSettlementState(const std::string& str) {
    if (str == "ATTENTION_REQUIRED") return SettlementState::ATTENTION_REQUIRED;
    return SettlementState::OPEN;
}

} // namespace checkout::domain
