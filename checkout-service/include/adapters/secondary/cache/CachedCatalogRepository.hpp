#pragma once

#include "ports/output/ICatalogRepository.hpp"
#include "adapters/secondary/persistence/PostgresCatalogRepository.hpp"
#include "settings/CacheSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <memory>
#include <iostream>

namespace checkout::adapters::secondary {

/**
 * @brief Read-through кэш справочника локаций и категорий
 *
 * Справочник хранится под одним ключом. invalidate() вызывается
 * при правке каталога администратором, TTL страхует от пропущенного вызова.
 */
class CachedCatalogRepository : public ports::output::ICatalogCache {
public:
    static constexpr const char* CATALOG_KEY = "catalog";

    CachedCatalogRepository(
        std::shared_ptr<PostgresCatalogRepository> delegate,
        std::shared_ptr<settings::CacheSettings> cacheSettings
    ) : delegate_(std::move(delegate))
    {
        size_t size = cacheSettings->getCatalogCacheSize();
        int ttlSeconds = cacheSettings->getCatalogTtlSeconds();

        auto base = std::make_unique<Cache<std::string, domain::CatalogSnapshot>>(
            size,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(ttlSeconds))
        );
        cache_ = std::make_unique<ThreadSafeCache<std::string, domain::CatalogSnapshot>>(std::move(base));

        std::cout << "[CachedCatalogRepository] Created with catalogCache="
                  << size << "/" << ttlSeconds << "s" << std::endl;
    }

    domain::CatalogSnapshot load() override {
        auto cached = cache_->get(CATALOG_KEY);
        if (cached) {
            return *cached;
        }

        auto snapshot = delegate_->load();
        cache_->put(CATALOG_KEY, snapshot);
        return snapshot;
    }

    void invalidate() override {
        cache_->clear();
    }

    size_t size() const {
        return cache_->size();
    }

private:
    std::shared_ptr<PostgresCatalogRepository> delegate_;
    std::unique_ptr<ICache<std::string, domain::CatalogSnapshot>> cache_;
};

} // namespace checkout::adapters::secondary
