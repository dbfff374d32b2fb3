#pragma once

#include "domain/CatalogSnapshot.hpp"

namespace checkout::ports::input {

class ICatalogService {
public:
    virtual ~ICatalogService() = default;
    virtual domain::CatalogSnapshot catalog() = 0;
    virtual void invalidate() = 0;
};

} // namespace checkout::ports::input
