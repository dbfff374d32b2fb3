#pragma once

#include "Money.hpp"
#include <string>

namespace checkout::domain {

/**
 * @brief Что покупатель хочет положить в корзину
 *
 * Пустая location означает "любая локация".
 */
struct ProductSelector {
    std::string location;
    std::string category;
    std::string variant;
    Money price;
};

} // namespace checkout::domain
