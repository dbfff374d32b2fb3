#pragma once

#include "ports/output/ICatalogRepository.hpp"
#include "adapters/secondary/persistence/PostgresSchema.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace checkout::adapters::secondary {

/**
 * @brief Локации и категории, для которых на складе есть хотя бы одна строка
 */
class PostgresCatalogRepository : public ports::output::ICatalogRepository {
public:
    explicit PostgresCatalogRepository(std::shared_ptr<PostgresSchema> schema)
        : schema_(std::move(schema))
    {
        std::cout << "[PostgresCatalogRepository] Created" << std::endl;
    }

    domain::CatalogSnapshot load() override {
        pqxx::connection c(schema_->connectionString());
        pqxx::work t(c);

        domain::CatalogSnapshot snapshot;
        for (const auto& row : t.exec("SELECT DISTINCT location FROM products ORDER BY location")) {
            snapshot.locations.push_back(row[0].as<std::string>());
        }
        for (const auto& row : t.exec("SELECT DISTINCT category FROM products ORDER BY category")) {
            snapshot.categories.push_back(row[0].as<std::string>());
        }
        std::cout << "[PostgresCatalogRepository] Loaded " << snapshot.locations.size()
                  << " locations, " << snapshot.categories.size() << " categories" << std::endl;
        return snapshot;
    }

private:
    std::shared_ptr<PostgresSchema> schema_;
};

} // namespace checkout::adapters::secondary
