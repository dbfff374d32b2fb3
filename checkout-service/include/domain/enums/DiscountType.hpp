#pragma once

#include <string>
#include <stdexcept>

namespace checkout::domain {

enum class DiscountType {
    PERCENTAGE,
    FIXED
};

inline std::string toString(DiscountType type) {
    switch (type) {
        case DiscountType::PERCENTAGE: return "percentage";
        case DiscountType::FIXED: return "fixed";
        default: return "unknown";
    }
}

inline DiscountType parseDiscountType(const std::string& str) {
    if (str == "percentage") return DiscountType::PERCENTAGE;
    if (str == "fixed") return DiscountType::FIXED;
    throw std::invalid_argument("unknown discount type: " + str);
}

} // namespace checkout::domain
