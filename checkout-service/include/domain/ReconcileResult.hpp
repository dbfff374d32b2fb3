#pragma once

#include "Money.hpp"
#include "enums/ReconcileOutcome.hpp"
#include <string>

namespace checkout::domain {

class ReconcileResult {
public:
    ReconcileOutcome outcome = ReconcileOutcome::UNKNOWN_PAYMENT;
    std::string paymentId;
    Money credited;
    std::string message;

    bool critical() const {
        return outcome == ReconcileOutcome::FINALIZATION_FAILED
            || outcome == ReconcileOutcome::ASSET_MISMATCH
            || outcome == ReconcileOutcome::INVALID_QUOTE;
    }
};

} // namespace checkout::domain
