#pragma once

#include "ports/output/IPaymentProcessor.hpp"
#include "adapters/secondary/payment/NowPaymentsGateway.hpp"
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
 * @brief Декоратор IPaymentProcessor с LRU кэшем минимальных сумм
 *
 * Кэш: asset -> минимальная сумма платежа.
 *
 * НЕ кэширует:
 * - Оценку суммы (курс меняется)
 * - Создание платежа
 */
class CachedPaymentProcessor : public ports::output::IPaymentProcessor {
public:
    CachedPaymentProcessor(
        std::shared_ptr<NowPaymentsGateway> delegate,
        std::shared_ptr<settings::CacheSettings> cacheSettings
    ) : delegate_(std::move(delegate))
    {
        size_t size = cacheSettings->getMinAmountCacheSize();
        int ttlSeconds = cacheSettings->getMinAmountTtlSeconds();

        auto base = std::make_unique<Cache<std::string, domain::Money>>(
            size,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(ttlSeconds))
        );
        minAmountCache_ = std::make_unique<ThreadSafeCache<std::string, domain::Money>>(std::move(base));

        std::cout << "[CachedPaymentProcessor] Created with minAmountCache="
                  << size << "/" << ttlSeconds << "s" << std::endl;
    }

    domain::Money estimate(const domain::Money& amount, const std::string& asset) override {
        return delegate_->estimate(amount, asset);
    }

    domain::Money minimumAmount(const std::string& asset) override {
        auto cached = minAmountCache_->get(asset);
        if (cached) {
            return *cached;
        }

        // ошибки не кэшируются: исключение пролетает мимо put
        auto minimum = delegate_->minimumAmount(asset);
        minAmountCache_->put(asset, minimum);
        return minimum;
    }

    domain::PaymentIntent createPayment(const domain::PaymentRequest& request) override {
        return delegate_->createPayment(request);
    }

    void clearMinAmountCache() {
        minAmountCache_->clear();
    }

    size_t getMinAmountCacheSize() const {
        return minAmountCache_->size();
    }

private:
    std::shared_ptr<NowPaymentsGateway> delegate_;
    std::unique_ptr<ICache<std::string, domain::Money>> minAmountCache_;
};

} // namespace checkout::adapters::secondary
