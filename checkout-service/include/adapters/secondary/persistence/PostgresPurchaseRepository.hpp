#pragma once

#include "ports/output/IPurchaseRepository.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "adapters/secondary/persistence/PostgresSchema.hpp"
#include "adapters/secondary/persistence/PgConvert.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <map>
#include <memory>
#include <set>
#include <iostream>

namespace checkout::adapters::secondary {

/**
 * @brief Финализация покупки одной транзакцией и журнал покупок
 *
 * Порядок блокировок: pending_settlements → buyers → products (по id) → basket_entries
 * → discount_codes. Любой отказ возвращается без commit, т.е. транзакция откатывается целиком.
 */
class PostgresPurchaseRepository : public ports::output::IPurchaseRepository {
public:
    PostgresPurchaseRepository(
        std::shared_ptr<PostgresSchema> schema,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : schema_(std::move(schema))
      , currency_(settings->getSettlementCurrency())
    {
        std::cout << "[PostgresPurchaseRepository] Created" << std::endl;
    }

    domain::FinalizeResult commitPurchase(const domain::PurchaseCommit& commit) override {
        domain::FinalizeResult result;
        result.totalPaid = domain::Money::zero(currency_);

        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);

        if (commit.settlementPaymentId) {
            auto closed = t.exec_params(
                "DELETE FROM pending_settlements WHERE payment_id = $1 AND state = 'OPEN' RETURNING payment_id",
                *commit.settlementPaymentId);
            if (closed.empty()) {
                result.status = domain::FinalizeStatus::ALREADY_SETTLED;
                result.message = "Settlement " + *commit.settlementPaymentId + " already closed";
                return result;
            }
        }

        if (commit.balanceDebit) {
            auto balance = t.exec_params(
                "SELECT balance FROM buyers WHERE buyer_id = $1 FOR UPDATE", commit.buyerId);
            auto current = balance.empty()
                ? domain::Money::zero(currency_)
                : pg::money(balance[0][0], currency_);
            if (current < *commit.balanceDebit) {
                result.status = domain::FinalizeStatus::INSUFFICIENT_BALANCE;
                result.message = "Balance " + current.toString() + " < " + commit.balanceDebit->toString();
                return result;
            }
        }

        std::set<int64_t> productIds;
        for (const auto& line : commit.lines) {
            productIds.insert(line.productId);
        }
        std::map<int64_t, std::string> pickupText;
        for (int64_t productId : productIds) {
            auto locked = t.exec_params(
                "SELECT id, pickup_text FROM products WHERE id = $1 FOR UPDATE", productId);
            if (locked.empty()) {
                return unavailable(result, productId);
            }
            pickupText[productId] = locked[0][1].as<std::string>();
        }

        std::set<int64_t> delivered;

        for (const auto& line : commit.lines) {
            auto consumed = t.exec_params(
                "DELETE FROM basket_entries WHERE id = ("
                "  SELECT id FROM basket_entries WHERE buyer_id = $1 AND product_id = $2 "
                "  ORDER BY reserved_at, id LIMIT 1 FOR UPDATE"
                ") RETURNING id",
                commit.buyerId, line.productId);

            pqxx::result decremented;
            if (!consumed.empty()) {
                decremented = t.exec_params(
                    "UPDATE products SET available = available - 1, reserved = reserved - 1 "
                    "WHERE id = $1 AND reserved >= 1 AND available >= 1 RETURNING id",
                    line.productId);
            } else {
                // резерв уже снят по TTL: подходит только свободная единица
                decremented = t.exec_params(
                    "UPDATE products SET available = available - 1 "
                    "WHERE id = $1 AND available > reserved RETURNING id",
                    line.productId);
            }
            if (decremented.empty()) {
                return unavailable(result, line.productId);
            }

            t.exec_params(
                "INSERT INTO purchases (buyer_id, product_id, product_name, category, variant, "
                "price_paid, location, purchased_at) "
                "VALUES ($1, $2, $3, $4, $5, $6::numeric, $7, to_timestamp($8::bigint))",
                commit.buyerId, line.productId, line.name, line.category, line.variant,
                line.pricePaid.toString(), line.location, commit.at.epochSeconds());

            result.totalPaid += line.pricePaid;
            ++result.itemCount;
            if (delivered.insert(line.productId).second) {
                result.pickups.push_back({line.productId, line.name, line.variant, pickupText[line.productId]});
            }
        }

        if (commit.discountCode && !commit.discountCode->empty()) {
            if (commit.settlementPaymentId) {
                // платёж уже получен по цене со скидкой: использование засчитывается всегда
                t.exec_params(
                    "UPDATE discount_codes SET uses_count = uses_count + 1 WHERE code = $1",
                    *commit.discountCode);
            } else {
                auto counted = t.exec_params(
                    "UPDATE discount_codes SET uses_count = uses_count + 1 "
                    "WHERE code = $1 AND is_active "
                    "AND (max_uses IS NULL OR uses_count < max_uses) "
                    "AND (expiry_date IS NULL OR expiry_date > to_timestamp($2::bigint)) "
                    "RETURNING code",
                    *commit.discountCode, commit.at.epochSeconds());
                if (counted.empty()) {
                    return discountRejected(result, *commit.discountCode);
                }
            }
        }

        t.exec_params(
            "INSERT INTO buyers (buyer_id, total_purchases) VALUES ($1, $2) "
            "ON CONFLICT (buyer_id) DO UPDATE SET total_purchases = buyers.total_purchases + EXCLUDED.total_purchases",
            commit.buyerId, result.itemCount);

        if (commit.balanceDebit) {
            t.exec_params(
                "UPDATE buyers SET balance = balance - $2::numeric WHERE buyer_id = $1",
                commit.buyerId, commit.balanceDebit->toString());
        }

        t.commit();

        result.status = domain::FinalizeStatus::SUCCESS;
        result.message = "Purchase committed";
        return result;
    }

    std::vector<domain::PurchaseRecord> history(int64_t buyerId, int limit) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);
        auto r = t.exec_params(
            "SELECT id, buyer_id, product_id, product_name, category, variant, price_paid, location, "
            "EXTRACT(EPOCH FROM purchased_at)::bigint "
            "FROM purchases WHERE buyer_id = $1 ORDER BY purchased_at DESC, id DESC LIMIT $2",
            buyerId, limit);

        std::vector<domain::PurchaseRecord> records;
        for (const auto& row : r) {
            domain::PurchaseRecord p;
            p.id = row[0].as<int64_t>();
            p.buyerId = row[1].as<int64_t>();
            p.productId = row[2].as<int64_t>();
            p.productName = row[3].as<std::string>();
            p.category = row[4].as<std::string>();
            p.variant = row[5].as<std::string>();
            p.pricePaid = pg::money(row[6], currency_);
            p.location = row[7].as<std::string>();
            p.purchasedAt = pg::timestamp(row[8]);
            records.push_back(p);
        }
        return records;
    }

private:
    std::shared_ptr<PostgresSchema> schema_;
    std::string currency_;

    static domain::FinalizeResult& unavailable(domain::FinalizeResult& result, int64_t productId) {
        result.status = domain::FinalizeStatus::UNIT_UNAVAILABLE;
        result.failedProductId = productId;
        result.itemCount = 0;
        result.totalPaid = domain::Money::zero(result.totalPaid.currency);
        result.pickups.clear();
        result.message = "Product " + std::to_string(productId) + " is no longer available";
        return result;
    }

    static domain::FinalizeResult& discountRejected(domain::FinalizeResult& result, const std::string& code) {
        result.status = domain::FinalizeStatus::DISCOUNT_REJECTED;
        result.itemCount = 0;
        result.totalPaid = domain::Money::zero(result.totalPaid.currency);
        result.pickups.clear();
        result.message = "Discount code " + code + " is no longer valid";
        return result;
    }
};

} // namespace checkout::adapters::secondary
