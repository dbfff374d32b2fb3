#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICheckoutService.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "adapters/primary/JsonViews.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace checkout::adapters::primary {

/**
 * @brief Баланс покупателя
 *
 * Endpoints:
 * - POST /api/v1/topups   {amount, asset} → платёж на пополнение
 * - GET  /api/v1/balance  → текущий баланс
 */
class TopUpHandler : public IHttpHandler {
public:
    TopUpHandler(
        std::shared_ptr<ports::input::ICheckoutService> checkoutService,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : checkoutService_(std::move(checkoutService))
      , currency_(settings->getSettlementCurrency())
    {
        std::cout << "[TopUpHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        auto buyerId = buyerIdOf(req);
        if (!buyerId) {
            sendError(res, 401, "X-Buyer-Id header required");
            return;
        }

        try {
            if (req.getMethod() == "POST") {
                handleTopUp(req, res, *buyerId);
            } else if (req.getMethod() == "GET") {
                nlohmann::json response;
                auto balance = checkoutService_->balance(*buyerId);
                response["balance"] = money(balance);
                response["currency"] = currency_;
                res.setResult(200, "application/json", response.dump());
            } else {
                sendError(res, 405, "Method not allowed");
            }
        } catch (const nlohmann::json::exception&) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[TopUpHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ICheckoutService> checkoutService_;
    std::string currency_;

    void handleTopUp(IRequest& req, IResponse& res, int64_t buyerId) {
        auto body = nlohmann::json::parse(req.getBody());

        std::string asset = body.value("asset", "");
        if (asset.empty()) {
            sendError(res, 400, "asset is required");
            return;
        }
        if (!body.contains("amount")) {
            sendError(res, 400, "amount is required");
            return;
        }

        domain::Money amount;
        try {
            const auto& value = body["amount"];
            amount = value.is_string()
                ? domain::Money::parse(value.get<std::string>(), currency_)
                : domain::Money::fromDouble(value.get<double>(), currency_);
        } catch (const std::invalid_argument&) {
            sendError(res, 400, "amount must be a decimal amount");
            return;
        }

        auto result = checkoutService_->openTopUp(buyerId, amount, asset);

        nlohmann::json response;
        response["status"] = domain::toString(result.status);
        response["message"] = result.message;
        if (result.intent) {
            response["payment"] = intentToJson(*result.intent);
        }
        res.setResult(intentHttpStatus(result.status), "application/json", response.dump());
    }
};

} // namespace checkout::adapters::primary
