#pragma once

#include <string>

namespace checkout::domain {

/**
 * @brief Классы ошибок платёжного процессора
 *
 * TRANSIENT повторяется один раз, остальные сразу отдаются наверх.
 */
enum class ProcessorErrorKind {
    TRANSIENT,
    UNSUPPORTED_ASSET,
    AMOUNT_TOO_LOW,
    INVALID_CREDENTIALS,
    REQUEST_REJECTED,
    INVALID_RESPONSE
};

inline std::string toString(ProcessorErrorKind kind) {
    switch (kind) {
        case ProcessorErrorKind::TRANSIENT: return "TRANSIENT";
        case ProcessorErrorKind::UNSUPPORTED_ASSET: return "UNSUPPORTED_ASSET";
        case ProcessorErrorKind::AMOUNT_TOO_LOW: return "AMOUNT_TOO_LOW";
        case ProcessorErrorKind::INVALID_CREDENTIALS: return "INVALID_CREDENTIALS";
        case ProcessorErrorKind::REQUEST_REJECTED: return "REQUEST_REJECTED";
        case ProcessorErrorKind::INVALID_RESPONSE: return "INVALID_RESPONSE";
        default: return "UNKNOWN";
    }
}

} // namespace checkout::domain
