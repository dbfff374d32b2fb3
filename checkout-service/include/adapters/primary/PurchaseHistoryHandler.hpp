#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICheckoutService.hpp"
#include "adapters/primary/JsonViews.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace checkout::adapters::primary {

/**
 * @brief GET /api/v1/purchases?limit=N: последние покупки, новые первыми
 */
class PurchaseHistoryHandler : public IHttpHandler {
public:
    explicit PurchaseHistoryHandler(std::shared_ptr<ports::input::ICheckoutService> checkoutService)
        : checkoutService_(std::move(checkoutService))
    {
        std::cout << "[PurchaseHistoryHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        auto buyerId = buyerIdOf(req);
        if (!buyerId) {
            sendError(res, 401, "X-Buyer-Id header required");
            return;
        }

        int limit = 0;
        auto limitParam = req.getQueryParam("limit");
        if (limitParam && !limitParam->empty()) {
            try {
                limit = std::stoi(*limitParam);
            } catch (const std::exception&) {
                sendError(res, 400, "limit must be an integer");
                return;
            }
        }

        try {
            auto records = checkoutService_->purchaseHistory(*buyerId, limit);

            nlohmann::json response;
            response["purchases"] = nlohmann::json::array();
            for (const auto& record : records) {
                response["purchases"].push_back(purchaseToJson(record));
            }
            res.setResult(200, "application/json", response.dump());
        } catch (const std::exception& e) {
            std::cerr << "[PurchaseHistoryHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ICheckoutService> checkoutService_;
};

} // namespace checkout::adapters::primary
