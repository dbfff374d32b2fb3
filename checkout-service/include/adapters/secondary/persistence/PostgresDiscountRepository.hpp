#pragma once

#include "ports/output/IDiscountCodeRepository.hpp"
#include "ports/output/IResellerDiscountRepository.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "adapters/secondary/persistence/PostgresSchema.hpp"
#include "adapters/secondary/persistence/PgConvert.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace checkout::adapters::secondary {

/**
 * @brief Общие скидочные коды и скидки реселлеров по категориям
 */
class PostgresDiscountRepository : public ports::output::IDiscountCodeRepository,
                                   public ports::output::IResellerDiscountRepository {
public:
    PostgresDiscountRepository(
        std::shared_ptr<PostgresSchema> schema,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : schema_(std::move(schema))
      , currency_(settings->getSettlementCurrency())
    {
        std::cout << "[PostgresDiscountRepository] Created" << std::endl;
    }

    std::optional<domain::DiscountCode> find(const std::string& code) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);
        auto r = t.exec_params(
            "SELECT code, discount_type, value, is_active, max_uses, uses_count, "
            "EXTRACT(EPOCH FROM expiry_date)::bigint "
            "FROM discount_codes WHERE code = $1",
            code);
        if (r.empty()) return std::nullopt;

        const auto& row = r[0];
        domain::DiscountCode d;
        d.code = row[0].as<std::string>();
        d.type = domain::parseDiscountType(row[1].as<std::string>());
        d.value = pg::money(row[2], d.type == domain::DiscountType::PERCENTAGE ? "%" : currency_);
        d.active = row[3].as<bool>();
        if (!row[4].is_null()) d.maxUses = row[4].as<int>();
        d.usesCount = row[5].as<int>();
        if (!row[6].is_null()) d.expiresAt = pg::timestamp(row[6]);
        return d;
    }

    domain::Percent percentageFor(int64_t buyerId, const std::string& category) override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);
        auto r = t.exec_params(
            "SELECT d.percentage FROM reseller_discounts d "
            "JOIN buyers b ON b.buyer_id = d.reseller_id AND b.is_reseller "
            "WHERE d.reseller_id = $1 AND d.category = $2",
            buyerId, category);
        if (r.empty() || r[0][0].is_null()) {
            return domain::Percent();
        }
        return domain::Percent::parse(r[0][0].as<std::string>());
    }

private:
    std::shared_ptr<PostgresSchema> schema_;
    std::string currency_;
};

} // namespace checkout::adapters::secondary
