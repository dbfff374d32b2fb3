#pragma once

#include "settings/INowPaymentsSettings.hpp"
#include <cstdlib>
#include <string>

namespace checkout::settings {

class NowPaymentsSettings : public INowPaymentsSettings {
public:
    std::string getHost() const override {
        const char* host = std::getenv("NOWPAYMENTS_HOST");
        return host ? host : "api.nowpayments.io";
    }

    int getPort() const override {
        const char* port = std::getenv("NOWPAYMENTS_PORT");
        return port ? std::stoi(port) : 80;
    }

    std::string getApiKey() const override {
        const char* key = std::getenv("NOWPAYMENTS_API_KEY");
        return key ? key : "";
    }

    std::string getIpnSecret() const override {
        const char* secret = std::getenv("NOWPAYMENTS_IPN_SECRET");
        return secret ? secret : "";
    }
};

} // namespace checkout::settings
