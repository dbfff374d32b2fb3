#pragma once

#include "BasketEntry.hpp"
#include "BasketView.hpp"
#include "enums/ReservationStatus.hpp"
#include <string>
#include <optional>

namespace checkout::domain {

class ReservationResult {
public:
    ReservationStatus status = ReservationStatus::ERROR;
    std::optional<BasketEntry> entry;
    BasketView basket;
    std::string message;

    bool reserved() const { return status == ReservationStatus::RESERVED; }
};

} // namespace checkout::domain
