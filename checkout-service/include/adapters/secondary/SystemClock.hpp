#pragma once

#include "ports/output/IClock.hpp"

namespace checkout::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() const override {
        return domain::Timestamp::now();
    }
};

} // namespace checkout::adapters::secondary
