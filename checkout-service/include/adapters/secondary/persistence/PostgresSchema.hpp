#pragma once

#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace checkout::adapters::secondary {

/**
 * @brief Создание таблиц сервиса при старте (CREATE TABLE IF NOT EXISTS)
 *
 * Репозитории получают схему через конструктор, поэтому к первому запросу
 * все таблицы уже существуют. Деньги хранятся в NUMERIC, время в TIMESTAMPTZ.
 */
class PostgresSchema {
public:
    explicit PostgresSchema(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS buyers (
                buyer_id BIGINT PRIMARY KEY,
                balance NUMERIC(24, 9) NOT NULL DEFAULT 0,
                is_reseller BOOLEAN NOT NULL DEFAULT FALSE,
                total_purchases INTEGER NOT NULL DEFAULT 0
            ))");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS products (
                id BIGSERIAL PRIMARY KEY,
                location TEXT NOT NULL,
                category TEXT NOT NULL,
                variant TEXT NOT NULL,
                name TEXT NOT NULL,
                pickup_text TEXT NOT NULL DEFAULT '',
                price NUMERIC(24, 9) NOT NULL,
                available INTEGER NOT NULL DEFAULT 0,
                reserved INTEGER NOT NULL DEFAULT 0,
                CHECK (reserved >= 0 AND reserved <= available)
            ))");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS basket_entries (
                id BIGSERIAL PRIMARY KEY,
                buyer_id BIGINT NOT NULL,
                product_id BIGINT NOT NULL REFERENCES products(id),
                reserved_price NUMERIC(24, 9) NOT NULL,
                reserved_at TIMESTAMPTZ NOT NULL
            ))");
        t.exec("CREATE INDEX IF NOT EXISTS basket_entries_buyer_idx ON basket_entries (buyer_id)");
        t.exec("CREATE INDEX IF NOT EXISTS basket_entries_reserved_at_idx ON basket_entries (reserved_at)");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS discount_codes (
                code TEXT PRIMARY KEY,
                discount_type TEXT NOT NULL CHECK (discount_type IN ('percentage', 'fixed')),
                value NUMERIC(24, 9) NOT NULL,
                is_active BOOLEAN NOT NULL DEFAULT TRUE,
                max_uses INTEGER,
                uses_count INTEGER NOT NULL DEFAULT 0,
                expiry_date TIMESTAMPTZ
            ))");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS reseller_discounts (
                reseller_id BIGINT NOT NULL,
                category TEXT NOT NULL,
                percentage NUMERIC(12, 9) NOT NULL,
                PRIMARY KEY (reseller_id, category)
            ))");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS pending_settlements (
                payment_id TEXT PRIMARY KEY,
                buyer_id BIGINT NOT NULL,
                settlement_asset TEXT NOT NULL,
                target_amount NUMERIC(24, 9) NOT NULL,
                expected_asset_amount NUMERIC(24, 9) NOT NULL,
                is_purchase BOOLEAN NOT NULL,
                basket_snapshot TEXT,
                discount_code_used TEXT,
                state TEXT NOT NULL DEFAULT 'OPEN',
                attention_reason TEXT,
                created_at TIMESTAMPTZ NOT NULL
            ))");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS purchases (
                id BIGSERIAL PRIMARY KEY,
                buyer_id BIGINT NOT NULL,
                product_id BIGINT NOT NULL,
                product_name TEXT NOT NULL,
                category TEXT NOT NULL,
                variant TEXT NOT NULL,
                price_paid NUMERIC(24, 9) NOT NULL,
                location TEXT NOT NULL,
                purchased_at TIMESTAMPTZ NOT NULL
            ))");
        t.exec("CREATE INDEX IF NOT EXISTS purchases_buyer_idx ON purchases (buyer_id, purchased_at DESC)");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS idempotency_keys (
                key TEXT PRIMARY KEY,
                response_status INTEGER NOT NULL,
                response_body TEXT NOT NULL
            ))");

        t.commit();
        std::cout << "[PostgresSchema] Tables ready in " << settings_->getName() << std::endl;
    }

    std::string connectionString() const {
        return settings_->getConnectionString();
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace checkout::adapters::secondary
