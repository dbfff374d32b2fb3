#pragma once

#include <string>

namespace checkout::domain {

enum class FinalizeStatus {
    SUCCESS,
    ALREADY_SETTLED,
    UNIT_UNAVAILABLE,
    INSUFFICIENT_BALANCE,
    DISCOUNT_REJECTED,
    FAILED
};

inline std::string toString(FinalizeStatus status) {
    switch (status) {
        case FinalizeStatus::SUCCESS: return "SUCCESS";
        case FinalizeStatus::ALREADY_SETTLED: return "ALREADY_SETTLED";
        case FinalizeStatus::UNIT_UNAVAILABLE: return "UNIT_UNAVAILABLE";
        case FinalizeStatus::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case FinalizeStatus::DISCOUNT_REJECTED: return "DISCOUNT_REJECTED";
        case FinalizeStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace checkout::domain
