#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICheckoutService.hpp"
#include "adapters/primary/JsonViews.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace checkout::adapters::primary {

/**
 * @brief POST /api/v1/checkout: оформить корзину
 *
 * Тело: {"method": "balance"} или {"method": "crypto", "asset": "btc"}
 */
class CheckoutHandler : public IHttpHandler {
public:
    explicit CheckoutHandler(std::shared_ptr<ports::input::ICheckoutService> checkoutService)
        : checkoutService_(std::move(checkoutService))
    {
        std::cout << "[CheckoutHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        auto buyerId = buyerIdOf(req);
        if (!buyerId) {
            sendError(res, 401, "X-Buyer-Id header required");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());
            auto method = domain::parseCheckoutMethod(body.value("method", ""));
            if (!method) {
                sendError(res, 400, "method must be 'balance' or 'crypto'");
                return;
            }
            std::string asset = body.value("asset", "");

            auto result = checkoutService_->checkout(*buyerId, *method, asset);

            nlohmann::json response;
            response["status"] = domain::toString(result.status);
            response["message"] = result.message;
            response["item_count"] = result.itemCount;
            response["original_total"] = money(result.originalTotal);
            response["discount_amount"] = money(result.discountAmount);
            response["final_total"] = money(result.finalTotal);
            if (result.intent) {
                response["payment"] = intentToJson(*result.intent);
            }
            if (result.intentStatus) {
                response["payment_status"] = domain::toString(*result.intentStatus);
            }

            res.setResult(httpStatus(result), "application/json", response.dump());
        } catch (const nlohmann::json::exception&) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[CheckoutHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ICheckoutService> checkoutService_;

    static int httpStatus(const domain::CheckoutResult& result) {
        switch (result.status) {
            case domain::CheckoutStatus::COMPLETED: return 201;
            case domain::CheckoutStatus::PAYMENT_PENDING: return 201;
            case domain::CheckoutStatus::EMPTY_BASKET: return 409;
            case domain::CheckoutStatus::INSUFFICIENT_BALANCE: return 402;
            case domain::CheckoutStatus::INVALID_REQUEST: return 400;
            case domain::CheckoutStatus::DISCOUNT_REJECTED: return 422;
            case domain::CheckoutStatus::PAYMENT_FAILED:
                return result.intentStatus ? intentHttpStatus(*result.intentStatus) : 502;
            case domain::CheckoutStatus::FAILED: return 500;
        }
        return 500;
    }
};

} // namespace checkout::adapters::primary
