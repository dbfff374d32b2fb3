#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IReservationService.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "adapters/primary/JsonViews.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace checkout::adapters::primary {

/**
 * @brief HTTP Handler корзины
 *
 * Endpoints:
 * - GET    /api/v1/basket                  → корзина с суммами и скидкой
 * - DELETE /api/v1/basket                  → отменить корзину (снять все резервы)
 * - POST   /api/v1/basket/items            → зарезервировать единицу (201 / 409)
 * - DELETE /api/v1/basket/items/{product}  → убрать позицию
 * - POST   /api/v1/basket/discount         → применить код
 * - DELETE /api/v1/basket/discount         → снять код
 *
 * Требует атрибут buyerId (BuyerIdExtractorMiddleware).
 */
class BasketHandler : public IHttpHandler {
public:
    static constexpr const char* BASKET_PATH = "/api/v1/basket";
    static constexpr const char* ITEMS_PATH = "/api/v1/basket/items";
    static constexpr const char* DISCOUNT_PATH = "/api/v1/basket/discount";

    BasketHandler(
        std::shared_ptr<ports::input::IReservationService> reservations,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : reservations_(std::move(reservations))
      , currency_(settings->getSettlementCurrency())
    {
        std::cout << "[BasketHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        auto buyerId = buyerIdOf(req);
        if (!buyerId) {
            sendError(res, 401, "X-Buyer-Id header required");
            return;
        }

        std::string method = req.getMethod();
        std::string path = extractPath(req.getPath());
        std::string itemsPrefix = std::string(ITEMS_PATH) + "/";

        try {
            if (method == "GET" && path == BASKET_PATH) {
                handleView(res, *buyerId);
            } else if (method == "DELETE" && path == BASKET_PATH) {
                handleClear(res, *buyerId);
            } else if (method == "POST" && path == ITEMS_PATH) {
                handleReserve(req, res, *buyerId);
            } else if (method == "DELETE" && path.rfind(itemsPrefix, 0) == 0) {
                handleRemove(res, *buyerId, path.substr(itemsPrefix.size()));
            } else if (method == "POST" && path == DISCOUNT_PATH) {
                handleApplyDiscount(req, res, *buyerId);
            } else if (method == "DELETE" && path == DISCOUNT_PATH) {
                handleRemoveDiscount(res, *buyerId);
            } else {
                sendError(res, 404, "Not found");
            }
        } catch (const nlohmann::json::exception&) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[BasketHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IReservationService> reservations_;
    std::string currency_;

    static std::string extractPath(const std::string& fullPath) {
        size_t pos = fullPath.find('?');
        return pos == std::string::npos ? fullPath : fullPath.substr(0, pos);
    }

    void handleView(IResponse& res, int64_t buyerId) {
        auto basket = reservations_->viewBasket(buyerId);
        res.setResult(200, "application/json", basketToJson(basket).dump());
    }

    void handleClear(IResponse& res, int64_t buyerId) {
        int released = reservations_->clearBasket(buyerId);
        nlohmann::json response;
        response["message"] = "Basket cleared";
        response["released"] = released;
        res.setResult(200, "application/json", response.dump());
    }

    void handleReserve(IRequest& req, IResponse& res, int64_t buyerId) {
        auto body = nlohmann::json::parse(req.getBody());

        domain::ProductSelector selector;
        selector.location = body.value("location", "");
        selector.category = body.value("category", "");
        selector.variant = body.value("variant", "");

        if (!body.contains("price")) {
            sendError(res, 400, "price is required");
            return;
        }
        try {
            const auto& price = body["price"];
            selector.price = price.is_string()
                ? domain::Money::parse(price.get<std::string>(), currency_)
                : domain::Money::fromDouble(price.get<double>(), currency_);
        } catch (const std::invalid_argument&) {
            sendError(res, 400, "price must be a decimal amount");
            return;
        }

        auto result = reservations_->reserve(buyerId, selector);

        nlohmann::json response;
        response["status"] = domain::toString(result.status);
        response["message"] = result.message;
        if (result.entry) {
            response["product_id"] = result.entry->productId;
            response["name"] = result.entry->name;
        }
        response["basket"] = basketToJson(result.basket);

        int httpStatus = 500;
        switch (result.status) {
            case domain::ReservationStatus::RESERVED: httpStatus = 201; break;
            case domain::ReservationStatus::OUT_OF_STOCK: httpStatus = 409; break;
            case domain::ReservationStatus::INVALID_SELECTION: httpStatus = 400; break;
            case domain::ReservationStatus::ERROR: httpStatus = 500; break;
        }
        res.setResult(httpStatus, "application/json", response.dump());
    }

    void handleRemove(IResponse& res, int64_t buyerId, const std::string& productIdText) {
        int64_t productId = 0;
        try {
            productId = std::stoll(productIdText);
        } catch (const std::exception&) {
            sendError(res, 400, "Product ID must be an integer");
            return;
        }

        if (!reservations_->removeItem(buyerId, productId)) {
            sendError(res, 404, "Product is not in the basket");
            return;
        }
        res.setResult(200, "application/json", basketToJson(reservations_->viewBasket(buyerId)).dump());
    }

    void handleApplyDiscount(IRequest& req, IResponse& res, int64_t buyerId) {
        auto body = nlohmann::json::parse(req.getBody());
        std::string code = body.value("code", "");
        if (code.empty()) {
            sendError(res, 400, "code is required");
            return;
        }

        auto resolution = reservations_->applyDiscount(buyerId, code);
        int httpStatus = resolution.applied() ? 200 : 422;
        res.setResult(httpStatus, "application/json", discountToJson(resolution).dump());
    }

    void handleRemoveDiscount(IResponse& res, int64_t buyerId) {
        reservations_->removeDiscount(buyerId);
        res.setResult(200, "application/json", basketToJson(reservations_->viewBasket(buyerId)).dump());
    }
};

} // namespace checkout::adapters::primary
