#pragma once

#include <string>

namespace checkout::domain {

enum class ReservationStatus {
    RESERVED,
    OUT_OF_STOCK,
    INVALID_SELECTION,
    ERROR
};

inline std::string toString(ReservationStatus status) {
    switch (status) {
        case ReservationStatus::RESERVED: return "RESERVED";
        case ReservationStatus::OUT_OF_STOCK: return "OUT_OF_STOCK";
        case ReservationStatus::INVALID_SELECTION: return "INVALID_SELECTION";
        case ReservationStatus::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace checkout::domain
