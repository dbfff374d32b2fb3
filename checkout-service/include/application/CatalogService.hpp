#pragma once

#include "ports/input/ICatalogService.hpp"
#include "ports/output/ICatalogRepository.hpp"
#include <memory>
#include <iostream>

namespace checkout::application {

class CatalogService : public ports::input::ICatalogService {
public:
    explicit CatalogService(std::shared_ptr<ports::output::ICatalogCache> cache)
        : cache_(std::move(cache))
    {
        std::cout << "[CatalogService] Created" << std::endl;
    }

    domain::CatalogSnapshot catalog() override {
        return cache_->load();
    }

    void invalidate() override {
        cache_->invalidate();
        std::cout << "[CatalogService] Catalog cache invalidated" << std::endl;
    }

private:
    std::shared_ptr<ports::output::ICatalogCache> cache_;
};

} // namespace checkout::application
