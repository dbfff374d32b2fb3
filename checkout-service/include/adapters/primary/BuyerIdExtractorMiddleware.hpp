#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/JsonViews.hpp"
#include <cctype>
#include <iostream>

namespace checkout::adapters::primary {

/**
 * @brief Middleware: X-Buyer-Id → атрибут "buyerId"
 *
 * Идентификатор покупателя передаёт чат-фронтенд. Без заголовка
 * или с неположительным значением запрос отклоняется с 401.
 */
class BuyerIdExtractorMiddleware : public IHttpHandler {
public:
    BuyerIdExtractorMiddleware() {
        std::cout << "[BuyerIdExtractorMiddleware] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        auto headers = req.getHeaders();
        auto it = headers.find("X-Buyer-Id");
        if (it == headers.end()) {
            it = headers.find("x-buyer-id");
        }
        if (it == headers.end() || it->second.empty()) {
            sendError(res, 401, "X-Buyer-Id header required");
            return;
        }

        auto buyerId = parseBuyerId(it->second);
        if (!buyerId) {
            sendError(res, 401, "X-Buyer-Id must be a positive integer");
            return;
        }

        req.setAttribute("buyerId", std::to_string(*buyerId));
        res.setStatus(0); // для middleware
    }

private:
    static std::optional<int64_t> parseBuyerId(const std::string& value) {
        for (char c : value) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
        }
        try {
            int64_t id = std::stoll(value);
            if (id <= 0) return std::nullopt;
            return id;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
};

} // namespace checkout::adapters::primary
