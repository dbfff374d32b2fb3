#pragma once

#include "domain/Timestamp.hpp"

namespace checkout::ports::output {

/**
 * @brief Источник текущего времени (подменяется в тестах)
 */
class IClock {
public:
    virtual ~IClock() = default;
    virtual domain::Timestamp now() const = 0;
};

} // namespace checkout::ports::output
