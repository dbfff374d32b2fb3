#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/output/IIdempotencyRepository.hpp"
#include "adapters/primary/JsonViews.hpp"
#include <memory>
#include <iostream>

namespace checkout::adapters::primary {

// Запоминает статус и тело, передавая их дальше
class ResponseCapture : public IResponse {
public:
    explicit ResponseCapture(IResponse& inner) : inner_(inner) {}

    void setStatus(int code) override {
        status_ = code;
        inner_.setStatus(code);
    }

    void setBody(const std::string& body) override {
        body_ = body;
        inner_.setBody(body);
    }

    void setHeader(const std::string& name, const std::string& value) override {
        inner_.setHeader(name, value);
    }

    int getStatus() const { return status_; }
    std::string getBody() const { return body_; }

private:
    IResponse& inner_;
    int status_ = 0;
    std::string body_;
};

/**
 * @brief Повтор POST/DELETE с тем же X-Idempotency-Key отдаёт сохранённый ответ
 *
 * Ключ хранится в пространстве покупателя: "<buyerId>:<key>". Сохраняются
 * только успешные (2xx) ответы.
 */
class IdempotentHandler : public IHttpHandler {
public:
    IdempotentHandler(std::shared_ptr<IHttpHandler> inner,
                      std::shared_ptr<ports::output::IIdempotencyRepository> repo)
        : inner_(std::move(inner)), repo_(std::move(repo))
    {
        std::cout << "[IdempotentHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        auto headers = req.getHeaders();
        std::string key;
        auto it = headers.find("X-Idempotency-Key");
        if (it != headers.end()) {
            key = it->second;
        }

        if ((req.getMethod() != "POST" && req.getMethod() != "DELETE") || key.empty()) {
            inner_->handle(req, res);
            return;
        }

        std::string scopedKey = req.getAttribute("buyerId").value_or("anonymous") + ":" + key;

        std::optional<domain::IdempotencyRecord> cached;
        try {
            cached = repo_->find(scopedKey);
        } catch (const std::exception& e) {
            std::cerr << "[IdempotentHandler] Lookup failed for " << scopedKey << ": " << e.what() << std::endl;
            sendError(res, 503, "Service temporarily unavailable");
            return;
        }
        if (cached) {
            std::cout << "[IdempotentHandler] Cache HIT for key: " << scopedKey << std::endl;
            res.setStatus(cached->status);
            res.setBody(cached->body);
            res.setHeader("Content-Type", "application/json");
            res.setHeader("X-Idempotency-Key-Used", "true");
            return;
        }

        ResponseCapture capture(res);
        inner_->handle(req, capture);

        if (capture.getStatus() >= 200 && capture.getStatus() < 300) {
            try {
                repo_->save(scopedKey, capture.getStatus(), capture.getBody());
            } catch (const std::exception& e) {
                std::cerr << "[IdempotentHandler] Could not store response for " << scopedKey
                          << ": " << e.what() << std::endl;
            }
        }
    }

private:
    std::shared_ptr<IHttpHandler> inner_;
    std::shared_ptr<ports::output::IIdempotencyRepository> repo_;
};

} // namespace checkout::adapters::primary
