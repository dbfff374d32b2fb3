#pragma once

#include <cstdlib>
#include <string>

namespace checkout::settings {

/**
 * @brief Настройки кэширования
 *
 * Читает из ENV:
 * - CACHE_MIN_AMOUNT_SIZE (default: 100)
 * - CACHE_MIN_AMOUNT_TTL_SECONDS (default: 600)
 * - CACHE_CATALOG_SIZE (default: 16)
 * - CACHE_CATALOG_TTL_SECONDS (default: 3600)
 */
class CacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("CACHE_MIN_AMOUNT_SIZE")) {
            minAmountCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("CACHE_MIN_AMOUNT_TTL_SECONDS")) {
            minAmountTtlSeconds_ = std::stoi(val);
        }
        if (const char* val = std::getenv("CACHE_CATALOG_SIZE")) {
            catalogCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("CACHE_CATALOG_TTL_SECONDS")) {
            catalogTtlSeconds_ = std::stoi(val);
        }
    }

    size_t getMinAmountCacheSize() const { return minAmountCacheSize_; }
    int getMinAmountTtlSeconds() const { return minAmountTtlSeconds_; }
    size_t getCatalogCacheSize() const { return catalogCacheSize_; }
    int getCatalogTtlSeconds() const { return catalogTtlSeconds_; }

private:
    size_t minAmountCacheSize_ = 100;
    int minAmountTtlSeconds_ = 600;
    size_t catalogCacheSize_ = 16;
    int catalogTtlSeconds_ = 3600;
};

} // namespace checkout::settings
