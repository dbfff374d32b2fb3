#pragma once

#include "domain/BasketSnapshot.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace checkout::adapters::secondary {

/**
 * @brief JSON-представление BasketSnapshot для колонки basket_snapshot
 *
 * Формат: {"version":1,"items":[{"product_id":..,"name":..,"category":..,
 * "variant":..,"location":..,"catalog_price":"50.00","discounted_price":"40.00"}]}
 * Суммы хранятся десятичными строками.
 */
class SnapshotCodec {
public:
    static std::string encode(const domain::BasketSnapshot& snapshot) {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& item : snapshot.items) {
            nlohmann::json j;
            j["product_id"] = item.productId;
            j["name"] = item.name;
            j["category"] = item.category;
            j["variant"] = item.variant;
            j["location"] = item.location;
            j["catalog_price"] = item.catalogPrice.toString();
            j["discounted_price"] = item.discountedPrice.toString();
            items.push_back(j);
        }

        nlohmann::json doc;
        doc["version"] = snapshot.version;
        doc["items"] = items;
        return doc.dump();
    }

    /**
     * @throws std::runtime_error при неизвестной версии или отсутствии обязательных полей
     */
    static domain::BasketSnapshot decode(const std::string& text, const std::string& currency) {
        auto doc = nlohmann::json::parse(text);

        int version = doc.value("version", 0);
        if (version != domain::BasketSnapshot::CURRENT_VERSION) {
            throw std::runtime_error("Unsupported basket snapshot version " + std::to_string(version));
        }

        domain::BasketSnapshot snapshot;
        snapshot.version = version;
        for (const auto& j : doc.at("items")) {
            domain::SnapshotItem item;
            item.productId = j.at("product_id").get<int64_t>();
            item.name = j.value("name", "");
            item.category = j.at("category").get<std::string>();
            item.variant = j.value("variant", "");
            item.location = j.value("location", "");
            item.catalogPrice = domain::Money::parse(j.at("catalog_price").get<std::string>(), currency);
            item.discountedPrice = domain::Money::parse(j.at("discounted_price").get<std::string>(), currency);
            snapshot.items.push_back(item);
        }
        return snapshot;
    }
};

} // namespace checkout::adapters::secondary
