#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICatalogService.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "adapters/primary/JsonViews.hpp"
#include <memory>
#include <iostream>

namespace checkout::adapters::primary {

/**
 * @brief GET /api/v1/catalog: локации и категории (из кэша)
 */
class CatalogHandler : public IHttpHandler {
public:
    explicit CatalogHandler(std::shared_ptr<ports::input::ICatalogService> catalogService)
        : catalogService_(std::move(catalogService))
    {
        std::cout << "[CatalogHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            auto snapshot = catalogService_->catalog();
            nlohmann::json response;
            response["locations"] = snapshot.locations;
            response["categories"] = snapshot.categories;
            res.setResult(200, "application/json", response.dump());
        } catch (const std::exception& e) {
            std::cerr << "[CatalogHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ICatalogService> catalogService_;
};

/**
 * @brief POST /api/v1/admin/catalog/invalidate: сбросить кэш справочника
 *
 * Требует X-Admin-Token, совпадающий с CHECKOUT_ADMIN_TOKEN.
 * Пустой CHECKOUT_ADMIN_TOKEN отключает endpoint (403).
 */
class CatalogInvalidateHandler : public IHttpHandler {
public:
    CatalogInvalidateHandler(
        std::shared_ptr<ports::input::ICatalogService> catalogService,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : catalogService_(std::move(catalogService))
      , adminToken_(settings->getAdminToken())
    {
        std::cout << "[CatalogInvalidateHandler] Created"
                  << (adminToken_.empty() ? ", disabled (no admin token)" : "") << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }
        if (adminToken_.empty()) {
            sendError(res, 403, "Admin endpoints are disabled");
            return;
        }

        auto headers = req.getHeaders();
        auto it = headers.find("X-Admin-Token");
        if (it == headers.end() || it->second != adminToken_) {
            sendError(res, 401, "Admin token required");
            return;
        }

        catalogService_->invalidate();

        nlohmann::json response;
        response["message"] = "Catalog cache invalidated";
        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::ICatalogService> catalogService_;
    std::string adminToken_;
};

} // namespace checkout::adapters::primary
