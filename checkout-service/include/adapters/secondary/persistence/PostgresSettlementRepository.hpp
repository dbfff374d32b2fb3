#pragma once

#include "ports/output/IPendingSettlementRepository.hpp"
#include "ports/output/IBuyerRepository.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "adapters/secondary/persistence/PostgresSchema.hpp"
#include "adapters/secondary/persistence/PgConvert.hpp"
#include "adapters/secondary/persistence/SnapshotCodec.hpp"
#include <pqxx/pqxx>
#include <map>
#include <memory>
#include <iostream>

namespace checkout::adapters::secondary {

/**
 * @brief Записи об ожидаемых расчётах и баланс покупателя
 *
 * Каждое закрытие записи (зачисление, снятие резервов) начинается с
 * DELETE ... RETURNING по payment_id: вторая доставка того же уведомления
 * ждёт блокировку строки, затем не находит её и ничего не меняет.
 */
class PostgresSettlementRepository : public ports::output::IPendingSettlementRepository,
                                     public ports::output::IBuyerRepository {
public:
    PostgresSettlementRepository(
        std::shared_ptr<PostgresSchema> schema,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : schema_(std::move(schema))
      , currency_(settings->getSettlementCurrency())
    {
        std::cout << "[PostgresSettlementRepository] Created" << std::endl;
    }

    // =========================================================================
    // IPendingSettlementRepository
    // =========================================================================

    void save(const domain::PendingSettlement& record) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);

        std::optional<std::string> snapshot;
        if (record.isPurchase) {
            snapshot = SnapshotCodec::encode(record.snapshot);
        }

        t.exec_params(
            "INSERT INTO pending_settlements (payment_id, buyer_id, settlement_asset, target_amount, "
            "expected_asset_amount, is_purchase, basket_snapshot, discount_code_used, state, created_at) "
            "VALUES ($1, $2, $3, $4::numeric, $5::numeric, $6, $7, $8, $9, to_timestamp($10::bigint))",
            record.paymentId, record.buyerId, record.settlementAsset,
            record.targetAmount.toString(), record.expectedAssetAmount.toString(),
            record.isPurchase, snapshot, record.discountCode,
            domain::toString(record.state), record.createdAt.epochSeconds());
        t.commit();
    }

    std::optional<domain::PendingSettlement> find(const std::string& paymentId) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);
        auto r = t.exec_params(
            "SELECT payment_id, buyer_id, settlement_asset, target_amount, expected_asset_amount, "
            "is_purchase, basket_snapshot, discount_code_used, state, "
            "EXTRACT(EPOCH FROM created_at)::bigint "
            "FROM pending_settlements WHERE payment_id = $1",
            paymentId);
        if (r.empty()) return std::nullopt;

        const auto& row = r[0];
        domain::PendingSettlement p;
        p.paymentId = row[0].as<std::string>();
        p.buyerId = row[1].as<int64_t>();
        p.settlementAsset = row[2].as<std::string>();
        p.targetAmount = pg::money(row[3], currency_);
        p.expectedAssetAmount = pg::money(row[4], p.settlementAsset);
        p.isPurchase = row[5].as<bool>();
        if (!row[6].is_null()) {
            p.snapshot = SnapshotCodec::decode(row[6].as<std::string>(), currency_);
        }
        if (!row[7].is_null()) {
            p.discountCode = row[7].as<std::string>();
        }
        p.state = domain::parseSettlementState(row[8].as<std::string>());
        p.createdAt = pg::timestamp(row[9]);
        return p;
    }

    bool closeAndRelease(const std::string& paymentId, bool releaseSnapshot) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);

        auto closed = t.exec_params(
            "DELETE FROM pending_settlements WHERE payment_id = $1 AND state = 'OPEN' "
            "RETURNING buyer_id, basket_snapshot",
            paymentId);
        if (closed.empty()) {
            return false;
        }

        int released = 0;
        if (releaseSnapshot && !closed[0][1].is_null()) {
            int64_t buyerId = closed[0][0].as<int64_t>();
            auto snapshot = SnapshotCodec::decode(closed[0][1].as<std::string>(), currency_);

            std::map<int64_t, int> perProduct;
            for (const auto& item : snapshot.items) {
                ++perProduct[item.productId];
            }

            for (const auto& [productId, count] : perProduct) {
                t.exec_params("SELECT id FROM products WHERE id = $1 FOR UPDATE", productId);
                // только строки, которые всё ещё в корзине: повтор ничего не снимет
                auto deleted = t.exec_params(
                    "DELETE FROM basket_entries WHERE id IN ("
                    "  SELECT id FROM basket_entries WHERE buyer_id = $1 AND product_id = $2 "
                    "  ORDER BY reserved_at, id LIMIT $3 FOR UPDATE"
                    ") RETURNING id",
                    buyerId, productId, count);
                if (!deleted.empty()) {
                    t.exec_params(
                        "UPDATE products SET reserved = GREATEST(reserved - $2, 0) WHERE id = $1",
                        productId, static_cast<int>(deleted.size()));
                    released += static_cast<int>(deleted.size());
                }
            }
        }

        t.commit();
        std::cout << "[PostgresSettlementRepository] Closed " << paymentId
                  << ", released " << released << " reservations" << std::endl;
        return true;
    }

    void markAttentionRequired(const std::string& paymentId, const std::string& reason) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);
        t.exec_params(
            "UPDATE pending_settlements SET state = 'ATTENTION_REQUIRED', attention_reason = $2 "
            "WHERE payment_id = $1",
            paymentId, reason);
        t.commit();
    }

    // =========================================================================
    // IBuyerRepository
    // =========================================================================

    domain::Money getBalance(int64_t buyerId) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);
        auto r = t.exec_params("SELECT balance FROM buyers WHERE buyer_id = $1", buyerId);
        if (r.empty()) return domain::Money::zero(currency_);
        return pg::money(r[0][0], currency_);
    }

    bool creditSettlement(const std::string& paymentId, int64_t buyerId, const domain::Money& amount) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);

        auto closed = t.exec_params(
            "DELETE FROM pending_settlements WHERE payment_id = $1 AND state = 'OPEN' RETURNING payment_id",
            paymentId);
        if (closed.empty()) {
            return false;
        }

        t.exec_params(
            "INSERT INTO buyers (buyer_id, balance) VALUES ($1, $2::numeric) "
            "ON CONFLICT (buyer_id) DO UPDATE SET balance = buyers.balance + EXCLUDED.balance",
            buyerId, amount.toString());
        t.commit();
        return true;
    }

private:
    std::shared_ptr<PostgresSchema> schema_;
    std::string currency_;
};

} // namespace checkout::adapters::secondary
