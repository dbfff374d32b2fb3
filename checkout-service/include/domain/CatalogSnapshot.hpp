#pragma once

#include <string>
#include <vector>
#include <algorithm>

namespace checkout::domain {

/**
 * @brief Справочник локаций и категорий товаров
 */
struct CatalogSnapshot {
    std::vector<std::string> locations;
    std::vector<std::string> categories;

    bool hasLocation(const std::string& location) const {
        return std::find(locations.begin(), locations.end(), location) != locations.end();
    }

    bool hasCategory(const std::string& category) const {
        return std::find(categories.begin(), categories.end(), category) != categories.end();
    }
};

} // namespace checkout::domain
