#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISettlementReconciler.hpp"
#include "adapters/primary/IpnSignatureVerifier.hpp"
#include "adapters/primary/JsonViews.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace checkout::adapters::primary {

/**
 * @brief POST /webhook: уведомление процессора о статусе платежа
 *
 * 401: нет секрета, нет или неверная подпись x-nowpayments-sig
 * 400: не JSON, нет обязательных полей, actually_paid не число
 * 500: хранилище недоступно, запись не тронута и повтор безопасен
 * 200: всё остальное, включая неизвестный платёж и промежуточные статусы
 */
class PaymentWebhookHandler : public IHttpHandler {
public:
    static constexpr const char* SIGNATURE_HEADER = "x-nowpayments-sig";

    PaymentWebhookHandler(
        std::shared_ptr<ports::input::ISettlementReconciler> reconciler,
        std::shared_ptr<IpnSignatureVerifier> verifier
    ) : reconciler_(std::move(reconciler))
      , verifier_(std::move(verifier))
    {
        std::cout << "[PaymentWebhookHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        std::string signature = findSignature(req);
        if (!verifier_->configured() || signature.empty()) {
            std::cerr << "[PaymentWebhookHandler] Rejected: "
                      << (signature.empty() ? "missing signature" : "IPN secret not configured") << std::endl;
            sendError(res, 401, "Signature required");
            return;
        }

        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.getBody());
        } catch (const nlohmann::json::exception&) {
            sendError(res, 400, "Invalid JSON");
            return;
        }

        if (!verifier_->verify(body, signature)) {
            std::cerr << "[PaymentWebhookHandler] Rejected: bad signature" << std::endl;
            sendError(res, 401, "Invalid signature");
            return;
        }

        domain::SettlementNotification notification;
        std::string error = parseNotification(body, notification);
        if (!error.empty()) {
            std::cerr << "[PaymentWebhookHandler] Malformed notification: " << error << std::endl;
            sendError(res, 400, error);
            return;
        }

        std::cout << "[PaymentWebhookHandler] " << notification.paymentId << " "
                  << notification.paymentStatus << " " << notification.actuallyPaid.toString()
                  << " " << notification.payCurrency << std::endl;

        auto result = reconciler_->reconcile(notification);
        if (result.outcome == domain::ReconcileOutcome::DATASTORE_UNAVAILABLE) {
            sendError(res, 500, "Temporarily unavailable, retry later");
            return;
        }

        nlohmann::json response;
        response["outcome"] = domain::toString(result.outcome);
        response["payment_id"] = result.paymentId;
        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::ISettlementReconciler> reconciler_;
    std::shared_ptr<IpnSignatureVerifier> verifier_;

    static std::string findSignature(IRequest& req) {
        auto headers = req.getHeaders();
        for (const auto& [name, value] : headers) {
            std::string lower = name;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower == SIGNATURE_HEADER) {
                return value;
            }
        }
        return "";
    }

    static std::string textField(const nlohmann::json& v) {
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
        if (v.is_number_unsigned()) return std::to_string(v.get<uint64_t>());
        return "";
    }

    /**
     * @return пустая строка при успехе, иначе описание ошибки
     */
    static std::string parseNotification(const nlohmann::json& body, domain::SettlementNotification& n) {
        if (!body.is_object()) {
            return "Body must be a JSON object";
        }
        for (const char* key : {"payment_id", "payment_status", "pay_currency", "actually_paid"}) {
            if (!body.contains(key) || body[key].is_null()) {
                return std::string("Missing field: ") + key;
            }
        }

        n.paymentId = textField(body["payment_id"]);
        n.paymentStatus = textField(body["payment_status"]);
        n.payCurrency = textField(body["pay_currency"]);
        std::transform(n.payCurrency.begin(), n.payCurrency.end(), n.payCurrency.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (n.paymentId.empty() || n.paymentStatus.empty() || n.payCurrency.empty()) {
            return "payment_id, payment_status and pay_currency must be non-empty";
        }

        const auto& paid = body["actually_paid"];
        try {
            if (paid.is_number()) {
                n.actuallyPaid = domain::Money::fromDouble(paid.get<double>(), n.payCurrency);
            } else if (paid.is_string()) {
                n.actuallyPaid = domain::Money::parse(paid.get<std::string>(), n.payCurrency);
            } else {
                return "actually_paid must be numeric";
            }
        } catch (const std::invalid_argument&) {
            return "actually_paid must be numeric";
        }

        if (body.contains("parent_payment_id") && !body["parent_payment_id"].is_null()) {
            auto parent = textField(body["parent_payment_id"]);
            if (!parent.empty()) {
                n.parentPaymentId = parent;
            }
        }
        return "";
    }
};

} // namespace checkout::adapters::primary
