#pragma once

#include "ports/input/IReservationService.hpp"
#include "ports/output/IInventoryRepository.hpp"
#include "ports/output/IDiscountCodeRepository.hpp"
#include "ports/output/ICatalogRepository.hpp"
#include "ports/output/IClock.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "application/DiscountResolver.hpp"
#include "application/SessionRegistry.hpp"
#include <memory>
#include <iostream>

namespace checkout::application {

/**
 * @brief Корзина покупателя поверх склада
 *
 * Атомарность резерва и строки корзины обеспечивает IInventoryRepository.
 * Здесь: проверка селектора по справочнику, ленивое снятие просроченных
 * резервов при просмотре и перепроверка применённого скидочного кода.
 */
class ReservationService : public ports::input::IReservationService {
public:
    ReservationService(
        std::shared_ptr<ports::output::IInventoryRepository> inventory,
        std::shared_ptr<ports::output::IDiscountCodeRepository> discounts,
        std::shared_ptr<ports::output::ICatalogRepository> catalog,
        std::shared_ptr<SessionRegistry> sessions,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : inventory_(std::move(inventory))
      , discounts_(std::move(discounts))
      , catalog_(std::move(catalog))
      , sessions_(std::move(sessions))
      , clock_(std::move(clock))
      , settings_(std::move(settings))
    {
        std::cout << "[ReservationService] Created, TTL "
                  << settings_->getReservationTtl().count() << "s" << std::endl;
    }

    domain::ReservationResult reserve(int64_t buyerId, const domain::ProductSelector& selector) override {
        domain::ReservationResult result;

        if (selector.category.empty() || selector.variant.empty() || !selector.price.isPositive()) {
            result.status = domain::ReservationStatus::INVALID_SELECTION;
            result.message = "category, variant and a positive price are required";
            return result;
        }

        try {
            auto known = catalog_->load();
            if (!known.hasCategory(selector.category)) {
                result.status = domain::ReservationStatus::INVALID_SELECTION;
                result.message = "Unknown category: " + selector.category;
                return result;
            }
            if (!selector.location.empty() && !known.hasLocation(selector.location)) {
                result.status = domain::ReservationStatus::INVALID_SELECTION;
                result.message = "Unknown location: " + selector.location;
                return result;
            }

            auto entry = inventory_->reserveUnit(buyerId, selector, clock_->now());
            if (!entry) {
                std::cout << "[ReservationService] OUT_OF_STOCK for buyer " << buyerId
                          << ": " << selector.category << "/" << selector.variant << std::endl;
                result.status = domain::ReservationStatus::OUT_OF_STOCK;
                result.message = "No units left for this selection";
                result.basket = buildView(buyerId, 0);
                return result;
            }

            std::cout << "[ReservationService] Buyer " << buyerId << " reserved product "
                      << entry->productId << std::endl;
            result.status = domain::ReservationStatus::RESERVED;
            result.entry = entry;
            result.message = "Reserved";
            result.basket = buildView(buyerId, 0);

        } catch (const std::exception& e) {
            std::cerr << "[ReservationService] reserve failed for buyer " << buyerId
                      << ": " << e.what() << std::endl;
            result.status = domain::ReservationStatus::ERROR;
            result.message = "Reservation failed, please retry";
        }

        return result;
    }

    bool removeItem(int64_t buyerId, int64_t productId) override {
        bool removed = inventory_->releaseEntry(buyerId, productId);
        std::cout << "[ReservationService] Buyer " << buyerId << " remove product " << productId
                  << (removed ? ": released" : ": not in basket") << std::endl;
        return removed;
    }

    int clearBasket(int64_t buyerId) override {
        int released = inventory_->clearBasket(buyerId);
        sessions_->setAppliedCode(buyerId, "");
        std::cout << "[ReservationService] Buyer " << buyerId << " cleared basket, released "
                  << released << std::endl;
        return released;
    }

    domain::BasketView viewBasket(int64_t buyerId) override {
        auto cutoff = clock_->now() - settings_->getReservationTtl();
        int expired = inventory_->releaseExpiredForBuyer(buyerId, cutoff);
        if (expired > 0) {
            std::cout << "[ReservationService] Released " << expired
                      << " expired entries for buyer " << buyerId << std::endl;
        }
        return buildView(buyerId, expired);
    }

    domain::DiscountResolution applyDiscount(int64_t buyerId, const std::string& code) override {
        auto total = basketTotal(inventory_->getBasket(buyerId));
        auto resolution = DiscountResolver::resolve(total, code, discounts_->find(code), clock_->now());

        if (resolution.applied()) {
            sessions_->setAppliedCode(buyerId, code);
        }
        std::cout << "[ReservationService] Buyer " << buyerId << " apply code " << code
                  << " -> " << domain::toString(resolution.status) << std::endl;
        return resolution;
    }

    void removeDiscount(int64_t buyerId) override {
        sessions_->setAppliedCode(buyerId, "");
    }

private:
    std::shared_ptr<ports::output::IInventoryRepository> inventory_;
    std::shared_ptr<ports::output::IDiscountCodeRepository> discounts_;
    std::shared_ptr<ports::output::ICatalogRepository> catalog_;
    std::shared_ptr<SessionRegistry> sessions_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<settings::ICheckoutSettings> settings_;

    domain::Money basketTotal(const std::vector<domain::BasketEntry>& items) const {
        domain::Money total = domain::Money::zero(settings_->getSettlementCurrency());
        for (const auto& item : items) {
            total += item.reservedPrice;
        }
        return total;
    }

    /**
     * @brief Собрать представление корзины и перепроверить код против текущей суммы
     */
    domain::BasketView buildView(int64_t buyerId, int expiredReleased) {
        domain::BasketView view;
        view.items = inventory_->getBasket(buyerId);
        view.expiredReleased = expiredReleased;
        view.originalTotal = basketTotal(view.items);

        std::string code = sessions_->appliedCode(buyerId);
        std::optional<domain::DiscountCode> found;
        if (!code.empty()) {
            found = discounts_->find(code);
        }
        view.discount = DiscountResolver::resolve(view.originalTotal, code, found, clock_->now());

        if (!code.empty() && !view.discount.applied()) {
            sessions_->dropAppliedCode(buyerId, code);
            view.notice = "Discount code " + code + " was removed: " + view.discount.message;
            std::cout << "[ReservationService] Dropped code " << code << " for buyer " << buyerId
                      << ": " << domain::toString(view.discount.status) << std::endl;
        }

        view.finalTotal = view.discount.finalTotal;
        return view;
    }
};

} // namespace checkout::application
