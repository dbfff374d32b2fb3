#pragma once

#include <string>

namespace checkout::settings {

class INowPaymentsSettings {
public:
    virtual ~INowPaymentsSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual std::string getApiKey() const = 0;

    /**
     * @brief Секрет для HMAC-подписи IPN; пустой означает, что вебхук отвергает всё
     */
    virtual std::string getIpnSecret() const = 0;
};

} // namespace checkout::settings
