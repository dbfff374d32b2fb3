#pragma once

#include <string>

namespace checkout::domain {

/**
 * @brief Итог проверки скидочного кода
 *
 * Порядок проверок: NOT_FOUND → INACTIVE → EXPIRED → EXHAUSTED.
 */
enum class DiscountStatus {
    NONE,
    APPLIED,
    NOT_FOUND,
    INACTIVE,
    EXPIRED,
    EXHAUSTED
};

inline std::string toString(DiscountStatus status) {
    switch (status) {
        case DiscountStatus::NONE: return "NONE";
        case DiscountStatus::APPLIED: return "APPLIED";
        case DiscountStatus::NOT_FOUND: return "NOT_FOUND";
        case DiscountStatus::INACTIVE: return "INACTIVE";
        case DiscountStatus::EXPIRED: return "EXPIRED";
        case DiscountStatus::EXHAUSTED: return "EXHAUSTED";
        default: return "UNKNOWN";
    }
}

} // namespace checkout::domain
