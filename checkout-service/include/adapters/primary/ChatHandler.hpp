#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IChatSessionService.hpp"
#include "adapters/primary/JsonViews.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace checkout::adapters::primary {

/**
 * @brief Чат-фронтенд: свободный текст и кнопки меню
 *
 * Endpoints:
 * - POST /api/v1/chat/messages  {text}    → обработать по текущему состоянию
 * - POST /api/v1/chat/state     {action}  → apply_discount | top_up | cancel
 */
class ChatHandler : public IHttpHandler {
public:
    static constexpr const char* MESSAGES_PATH = "/api/v1/chat/messages";
    static constexpr const char* STATE_PATH = "/api/v1/chat/state";

    explicit ChatHandler(std::shared_ptr<ports::input::IChatSessionService> chat)
        : chat_(std::move(chat))
    {
        std::cout << "[ChatHandler] Created" << std::endl;
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

        std::string path = req.getPath();
        path = path.substr(0, path.find('?'));

        try {
            auto body = nlohmann::json::parse(req.getBody());

            domain::ChatReply reply;
            if (path == MESSAGES_PATH) {
                reply = chat_->handleMessage(*buyerId, body.value("text", ""));
            } else if (path == STATE_PATH) {
                std::string action = body.value("action", "");
                if (action.empty()) {
                    sendError(res, 400, "action is required");
                    return;
                }
                reply = chat_->enter(*buyerId, action);
            } else {
                sendError(res, 404, "Not found");
                return;
            }

            nlohmann::json response;
            response["state"] = domain::toString(reply.state);
            response["text"] = reply.text;
            response["accepted"] = reply.accepted;
            if (reply.intent) {
                response["payment"] = intentToJson(*reply.intent);
            }
            res.setResult(200, "application/json", response.dump());
        } catch (const nlohmann::json::exception&) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[ChatHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IChatSessionService> chat_;
};

} // namespace checkout::adapters::primary
