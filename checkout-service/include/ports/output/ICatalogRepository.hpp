#pragma once

#include "domain/CatalogSnapshot.hpp"

namespace checkout::ports::output {

class ICatalogRepository {
public:
    virtual ~ICatalogRepository() = default;
    virtual domain::CatalogSnapshot load() = 0;
};

/**
 * @brief Кэширующий справочник со сбросом по команде администратора
 */
class ICatalogCache : public ICatalogRepository {
public:
    virtual void invalidate() = 0;
};

} // namespace checkout::ports::output
