#pragma once

#include "ports/output/IInventoryRepository.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "adapters/secondary/persistence/PostgresSchema.hpp"
#include "adapters/secondary/persistence/PgConvert.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace checkout::adapters::secondary {

/**
 * @brief Склад и корзины в PostgreSQL
 *
 * Порядок блокировок во всех транзакциях: строка products, затем basket_entries.
 * Строка корзины и счётчик reserved меняются только вместе, в одной транзакции.
 */
class PostgresInventoryRepository : public ports::output::IInventoryRepository {
public:
    PostgresInventoryRepository(
        std::shared_ptr<PostgresSchema> schema,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : schema_(std::move(schema))
      , currency_(settings->getSettlementCurrency())
    {
        std::cout << "[PostgresInventoryRepository] Created" << std::endl;
    }

    std::optional<domain::BasketEntry> reserveUnit(
        int64_t buyerId,
        const domain::ProductSelector& selector,
        const domain::Timestamp& now) override
    {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);

        auto r = t.exec_params(
            "SELECT id, name, category, variant, location, price FROM products "
            "WHERE category = $1 AND variant = $2 AND price = $3::numeric "
            "AND ($4 = '' OR location = $4) AND available > reserved "
            "ORDER BY id LIMIT 1 FOR UPDATE",
            selector.category, selector.variant, selector.price.toString(), selector.location);
        if (r.empty()) {
            return std::nullopt;
        }

        domain::BasketEntry entry;
        entry.productId = r[0][0].as<int64_t>();
        entry.name = r[0][1].as<std::string>();
        entry.category = r[0][2].as<std::string>();
        entry.variant = r[0][3].as<std::string>();
        entry.location = r[0][4].as<std::string>();
        entry.reservedPrice = pg::money(r[0][5], currency_);
        entry.reservedAt = now;

        auto updated = t.exec_params(
            "UPDATE products SET reserved = reserved + 1 WHERE id = $1 AND available > reserved",
            entry.productId);
        if (updated.affected_rows() != 1) {
            return std::nullopt;
        }

        auto inserted = t.exec_params(
            "INSERT INTO basket_entries (buyer_id, product_id, reserved_price, reserved_at) "
            "VALUES ($1, $2, $3::numeric, to_timestamp($4::bigint)) RETURNING id",
            buyerId, entry.productId, entry.reservedPrice.toString(), now.epochSeconds());
        entry.entryId = inserted[0][0].as<int64_t>();

        t.commit();
        return entry;
    }

    bool releaseEntry(int64_t buyerId, int64_t productId) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);

        t.exec_params("SELECT id FROM products WHERE id = $1 FOR UPDATE", productId);
        auto deleted = t.exec_params(
            "DELETE FROM basket_entries WHERE id = ("
            "  SELECT id FROM basket_entries WHERE buyer_id = $1 AND product_id = $2 "
            "  ORDER BY reserved_at, id LIMIT 1 FOR UPDATE"
            ") RETURNING id",
            buyerId, productId);
        if (deleted.empty()) {
            return false;
        }

        decrementReserved(t, productId, 1);
        t.commit();
        return true;
    }

    int clearBasket(int64_t buyerId) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);

        auto products = t.exec_params(
            "SELECT id FROM products WHERE id IN "
            "(SELECT product_id FROM basket_entries WHERE buyer_id = $1) "
            "ORDER BY id FOR UPDATE",
            buyerId);
        if (products.empty()) {
            return 0;
        }

        auto deleted = t.exec_params(
            "DELETE FROM basket_entries WHERE buyer_id = $1 RETURNING product_id", buyerId);
        for (const auto& row : deleted) {
            decrementReserved(t, row[0].as<int64_t>(), 1);
        }

        t.commit();
        return static_cast<int>(deleted.size());
    }

    std::vector<domain::BasketEntry> getBasket(int64_t buyerId) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);

        auto r = t.exec_params(
            "SELECT e.id, e.product_id, p.name, p.category, p.variant, p.location, "
            "e.reserved_price, EXTRACT(EPOCH FROM e.reserved_at)::bigint "
            "FROM basket_entries e JOIN products p ON p.id = e.product_id "
            "WHERE e.buyer_id = $1 ORDER BY e.reserved_at, e.id",
            buyerId);

        std::vector<domain::BasketEntry> items;
        for (const auto& row : r) {
            domain::BasketEntry e;
            e.entryId = row[0].as<int64_t>();
            e.productId = row[1].as<int64_t>();
            e.name = row[2].as<std::string>();
            e.category = row[3].as<std::string>();
            e.variant = row[4].as<std::string>();
            e.location = row[5].as<std::string>();
            e.reservedPrice = pg::money(row[6], currency_);
            e.reservedAt = pg::timestamp(row[7]);
            items.push_back(e);
        }
        return items;
    }

    int releaseExpired(const domain::Timestamp& cutoff) override {
        return releaseExpiredWhere(
            "SELECT id, product_id FROM basket_entries WHERE reserved_at <= to_timestamp($1::bigint)",
            cutoff, std::nullopt);
    }

    int releaseExpiredForBuyer(int64_t buyerId, const domain::Timestamp& cutoff) override {
        return releaseExpiredWhere(
            "SELECT id, product_id FROM basket_entries "
            "WHERE reserved_at <= to_timestamp($1::bigint) AND buyer_id = $2",
            cutoff, buyerId);
    }

private:
    std::shared_ptr<PostgresSchema> schema_;
    std::string currency_;

    static void decrementReserved(pqxx::work& t, int64_t productId, int count) {
        t.exec_params(
            "UPDATE products SET reserved = GREATEST(reserved - $2, 0) WHERE id = $1",
            productId, count);
    }

    /**
     * @brief Каждая просроченная строка снимается своей транзакцией
     *
     * Строка, которую успела забрать финализация, к моменту DELETE уже удалена
     * и просто пропускается.
     */
    int releaseExpiredWhere(const std::string& selectSql,
                            const domain::Timestamp& cutoff,
                            const std::optional<int64_t>& buyerId) {
        pqxx::connection c(schema_->connectionString());

        pqxx::result candidates;
        {
            pqxx::work t(c);
            candidates = buyerId
                ? t.exec_params(selectSql, cutoff.epochSeconds(), *buyerId)
                : t.exec_params(selectSql, cutoff.epochSeconds());
            t.commit();
        }

        int released = 0;
        for (const auto& row : candidates) {
            int64_t entryId = row[0].as<int64_t>();
            int64_t productId = row[1].as<int64_t>();

            pqxx::work t(c);
            t.exec_params("SELECT id FROM products WHERE id = $1 FOR UPDATE", productId);
            auto deleted = t.exec_params(
                "DELETE FROM basket_entries WHERE id = $1 AND reserved_at <= to_timestamp($2::bigint) "
                "RETURNING id",
                entryId, cutoff.epochSeconds());
            if (!deleted.empty()) {
                decrementReserved(t, productId, 1);
                ++released;
            }
            t.commit();
        }
        return released;
    }
};

} // namespace checkout::adapters::secondary
