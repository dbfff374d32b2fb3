#pragma once

#include "ports/output/IPurchaseRepository.hpp"
#include "ports/output/IResellerDiscountRepository.hpp"
#include "ports/output/IClock.hpp"
#include "application/DiscountResolver.hpp"
#include "domain/BasketSnapshot.hpp"
#include "domain/FinalizeResult.hpp"
#include "domain/PurchaseCommit.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <iostream>

namespace checkout::application {

/**
 * @brief Превращение оплаченного снимка корзины в записи о покупках
 *
 * Цена в журнале считается здесь от цены каталога и процента реселлера
 * на категорию, независимо от общего скидочного кода. Всё остальное
 * (склад, журнал, счётчик кода, баланс, запись о расчёте) применяется
 * одной транзакцией в IPurchaseRepository::commitPurchase.
 */
class PurchaseFinalizer {
public:
    PurchaseFinalizer(
        std::shared_ptr<ports::output::IPurchaseRepository> purchases,
        std::shared_ptr<ports::output::IResellerDiscountRepository> resellerDiscounts,
        std::shared_ptr<ports::output::IClock> clock
    ) : purchases_(std::move(purchases))
      , resellerDiscounts_(std::move(resellerDiscounts))
      , clock_(std::move(clock))
    {
        std::cout << "[PurchaseFinalizer] Created" << std::endl;
    }

    /**
     * @param settlementPaymentId платёж, чья запись закрывается вместе с покупкой
     * @param balanceDebit сумма списания с баланса (оплата с баланса)
     */
    domain::FinalizeResult finalize(
        int64_t buyerId,
        const domain::BasketSnapshot& snapshot,
        const std::optional<std::string>& discountCode,
        const std::optional<std::string>& settlementPaymentId,
        const std::optional<domain::Money>& balanceDebit)
    {
        domain::FinalizeResult result;
        if (snapshot.empty()) {
            result.status = domain::FinalizeStatus::FAILED;
            result.message = "Empty basket snapshot";
            return result;
        }

        try {
            domain::PurchaseCommit commit;
            commit.buyerId = buyerId;
            commit.discountCode = discountCode;
            commit.settlementPaymentId = settlementPaymentId;
            commit.balanceDebit = balanceDebit;
            commit.at = clock_->now();

            std::map<std::string, domain::Percent> percentByCategory;
            for (const auto& item : snapshot.items) {
                auto it = percentByCategory.find(item.category);
                if (it == percentByCategory.end()) {
                    it = percentByCategory.emplace(
                        item.category,
                        resellerDiscounts_->percentageFor(buyerId, item.category)).first;
                }

                domain::PurchaseLine line;
                line.productId = item.productId;
                line.name = item.name;
                line.category = item.category;
                line.variant = item.variant;
                line.location = item.location;
                line.pricePaid = DiscountResolver::resellerPrice(item.catalogPrice, it->second);
                commit.lines.push_back(line);
            }

            result = purchases_->commitPurchase(commit);

        } catch (const std::exception& e) {
            std::cerr << "[PurchaseFinalizer] Commit failed for buyer " << buyerId
                      << ": " << e.what() << std::endl;
            result.status = domain::FinalizeStatus::FAILED;
            result.message = e.what();
            return result;
        }

        if (result.success()) {
            std::cout << "[PurchaseFinalizer] Buyer " << buyerId << " purchased " << result.itemCount
                      << " items for " << result.totalPaid.toString() << std::endl;
        } else {
            std::cerr << "[PurchaseFinalizer] Buyer " << buyerId << " finalize "
                      << domain::toString(result.status) << ": " << result.message << std::endl;
        }
        return result;
    }

    /**
     * @brief Сообщение покупателю: заголовок и данные самовывоза по каждому товару
     */
    static std::string deliveryNotice(const std::string& title, const domain::FinalizeResult& result) {
        std::string text = title + " Pickup details below:";
        for (const auto& pickup : result.pickups) {
            text += "\n\n--- Item: " + pickup.name + " " + pickup.variant + " ---\n";
            text += pickup.text.empty() ? "(No specific pickup details provided)" : pickup.text;
        }
        return text;
    }

private:
    std::shared_ptr<ports::output::IPurchaseRepository> purchases_;
    std::shared_ptr<ports::output::IResellerDiscountRepository> resellerDiscounts_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace checkout::application
