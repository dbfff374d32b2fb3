#pragma once

#include "domain/Percent.hpp"
#include <string>
#include <cstdint>

namespace checkout::ports::output {

class IResellerDiscountRepository {
public:
    virtual ~IResellerDiscountRepository() = default;

    /**
     * @brief Процент скидки реселлера на категорию
     * @return ноль, если покупатель не активный реселлер или правила нет
     */
    virtual domain::Percent percentageFor(int64_t buyerId, const std::string& category) = 0;
};

} // namespace checkout::ports::output
