#pragma once

#include <string>

namespace checkout::domain {

enum class IntentStatus {
    OPENED,
    BELOW_MINIMUM,
    UNSUPPORTED_ASSET,
    INVALID_QUOTE,
    PROCESSOR_UNAVAILABLE,
    PROCESSOR_REJECTED,
    PERSISTENCE_FAILED
};

inline std::string toString(IntentStatus status) {
    switch (status) {
        case IntentStatus::OPENED: return "OPENED";
        case IntentStatus::BELOW_MINIMUM: return "BELOW_MINIMUM";
        case IntentStatus::UNSUPPORTED_ASSET: return "UNSUPPORTED_ASSET";
        case IntentStatus::INVALID_QUOTE: return "INVALID_QUOTE";
        case IntentStatus::PROCESSOR_UNAVAILABLE: return "PROCESSOR_UNAVAILABLE";
        case IntentStatus::PROCESSOR_REJECTED: return "PROCESSOR_REJECTED";
        case IntentStatus::PERSISTENCE_FAILED: return "PERSISTENCE_FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace checkout::domain
