#pragma once

#include "ports/output/IPaymentProcessor.hpp"
#include "settings/INowPaymentsSettings.hpp"
#include "settings/ICheckoutSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <memory>
#include <iostream>

namespace checkout::adapters::secondary {

/**
 * @brief HTTP клиент к платёжному процессору (API NOWPayments)
 *
 * Endpoints:
 * - GET  /v1/estimate?amount=&currency_from=&currency_to=
 * - GET  /v1/min-amount?currency_from=
 * - POST /v1/payment
 *
 * Ошибки отдаются как PaymentProcessorException. TRANSIENT (5xx, сбой
 * транспорта) повторяется один раз с тем же телом запроса.
 */
class NowPaymentsGateway : public ports::output::IPaymentProcessor {
public:
    NowPaymentsGateway(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::INowPaymentsSettings> settings,
        std::shared_ptr<settings::ICheckoutSettings> checkoutSettings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
      , checkoutSettings_(std::move(checkoutSettings))
    {
        std::cout << "[NowPaymentsGateway] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    domain::Money estimate(const domain::Money& amount, const std::string& asset) override {
        std::string path = "/v1/estimate?amount=" + amount.toString() +
                           "&currency_from=" + checkoutSettings_->getSettlementCurrency() +
                           "&currency_to=" + asset;
        auto json = withRetry("estimate", [&]() { return doRequest("GET", path, ""); });
        return amountField(json, "estimated_amount", asset);
    }

    domain::Money minimumAmount(const std::string& asset) override {
        auto json = withRetry("min-amount", [&]() {
            return doRequest("GET", "/v1/min-amount?currency_from=" + asset, "");
        });
        return amountField(json, "min_amount", asset);
    }

    domain::PaymentIntent createPayment(const domain::PaymentRequest& request) override {
        nlohmann::json body;
        body["price_amount"] = request.amount.toDouble();
        body["price_currency"] = request.asset;
        body["pay_currency"] = request.asset;
        body["ipn_callback_url"] = request.callbackUrl;
        body["order_id"] = request.orderReference;
        body["order_description"] = request.description;
        body["is_fixed_rate"] = false;
        std::string payload = body.dump();

        auto json = withRetry("payment", [&]() { return doRequest("POST", "/v1/payment", payload); });

        for (const char* key : {"payment_id", "pay_address", "pay_amount", "pay_currency"}) {
            if (!json.contains(key) || json[key].is_null()) {
                throw domain::PaymentProcessorException(
                    domain::ProcessorErrorKind::INVALID_RESPONSE,
                    std::string("payment response misses ") + key);
            }
        }

        domain::PaymentIntent intent;
        intent.paymentId = json["payment_id"].is_string()
            ? json["payment_id"].get<std::string>()
            : std::to_string(json["payment_id"].get<int64_t>());
        intent.payAddress = json["pay_address"].get<std::string>();
        intent.payCurrency = json["pay_currency"].get<std::string>();
        intent.payAmount = amountField(json, "pay_amount", intent.payCurrency);
        if (json.contains("expiration_estimate_date") && json["expiration_estimate_date"].is_string()) {
            intent.expiresAt = json["expiration_estimate_date"].get<std::string>();
        }
        return intent;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::INowPaymentsSettings> settings_;
    std::shared_ptr<settings::ICheckoutSettings> checkoutSettings_;

    nlohmann::json withRetry(const std::string& what, const std::function<nlohmann::json()>& call) {
        try {
            return call();
        } catch (const domain::PaymentProcessorException& e) {
            if (e.kind() != domain::ProcessorErrorKind::TRANSIENT) {
                throw;
            }
            std::cerr << "[NowPaymentsGateway] " << what << " transient failure, retrying once: "
                      << e.what() << std::endl;
        }
        return call();
    }

    nlohmann::json doRequest(const std::string& method, const std::string& path, const std::string& body) {
        std::map<std::string, std::string> headers = {{"x-api-key", settings_->getApiKey()}};
        if (!body.empty()) {
            headers["Content-Type"] = "application/json";
        }

        SimpleRequest request(method, path, body, settings_->getHost(), settings_->getPort(), headers);
        SimpleResponse response;

        if (!httpClient_->send(request, response)) {
            throw domain::PaymentProcessorException(
                domain::ProcessorErrorKind::TRANSIENT, "transport failure on " + method + " " + path);
        }

        int status = response.getStatus();
        const std::string& text = response.getBody();
        if (status < 200 || status >= 300) {
            throw classify(status, text);
        }

        try {
            return nlohmann::json::parse(text);
        } catch (const nlohmann::json::exception& e) {
            throw domain::PaymentProcessorException(
                domain::ProcessorErrorKind::INVALID_RESPONSE, std::string("invalid JSON: ") + e.what(), status);
        }
    }

    static domain::PaymentProcessorException classify(int status, const std::string& body) {
        std::string lower = body;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::string excerpt = body.substr(0, 200);

        if (status == 401 || status == 403) {
            return {domain::ProcessorErrorKind::INVALID_CREDENTIALS, "API key rejected", status};
        }
        if (status >= 500) {
            return {domain::ProcessorErrorKind::TRANSIENT, "processor error: " + excerpt, status};
        }
        if (lower.find("currencies not found") != std::string::npos) {
            return {domain::ProcessorErrorKind::UNSUPPORTED_ASSET, excerpt, status};
        }
        if (status == 400 && body.find("AMOUNT_MINIMAL_ERROR") != std::string::npos) {
            return {domain::ProcessorErrorKind::AMOUNT_TOO_LOW, excerpt, status};
        }
        return {domain::ProcessorErrorKind::REQUEST_REJECTED, excerpt, status};
    }

    /**
     * @brief Процессор присылает суммы то числом, то строкой
     */
    static domain::Money amountField(const nlohmann::json& json, const std::string& key, const std::string& asset) {
        if (!json.contains(key) || json[key].is_null()) {
            throw domain::PaymentProcessorException(
                domain::ProcessorErrorKind::INVALID_RESPONSE, "response misses " + key);
        }
        const auto& v = json[key];
        try {
            if (v.is_string()) {
                return domain::Money::parse(v.get<std::string>(), asset);
            }
            if (v.is_number()) {
                return domain::Money::fromDouble(v.get<double>(), asset);
            }
        } catch (const std::invalid_argument& e) {
            throw domain::PaymentProcessorException(domain::ProcessorErrorKind::INVALID_RESPONSE, e.what());
        }
        throw domain::PaymentProcessorException(
            domain::ProcessorErrorKind::INVALID_RESPONSE, key + " is not a number");
    }
};

} // namespace checkout::adapters::secondary
