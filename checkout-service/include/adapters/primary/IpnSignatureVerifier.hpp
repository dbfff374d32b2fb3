#pragma once

#include "settings/INowPaymentsSettings.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <iostream>

namespace checkout::adapters::primary {

/**
 * @brief Проверка подписи уведомлений процессора
 *
 * Подпись: hex(HMAC-SHA512(secret, canonical(body))), где canonical это
 * компактный JSON с ключами, отсортированными на всех уровнях, в том виде,
 * в каком его пишет JSON.stringify процессора. Сравнение за постоянное время.
 */
class IpnSignatureVerifier {
public:
    explicit IpnSignatureVerifier(std::shared_ptr<settings::INowPaymentsSettings> settings)
        : secret_(settings->getIpnSecret())
    {
        if (secret_.empty()) {
            std::cerr << "[IpnSignatureVerifier] NOWPAYMENTS_IPN_SECRET is empty, "
                      << "every notification will be rejected" << std::endl;
        }
    }

    bool configured() const { return !secret_.empty(); }

    /**
     * @brief Объекты nlohmann::json лежат в std::map, ключи уже отсортированы
     *
     * Дробные числа пишутся по правилам Number#toString: 1e-7, 0.000015, 1
     * вместо 1e-07, 1.5e-05, 1.0 у dump().
     */
    static std::string canonical(const nlohmann::json& body) {
        switch (body.type()) {
            case nlohmann::json::value_t::object: {
                std::string out = "{";
                for (auto it = body.begin(); it != body.end(); ++it) {
                    if (it != body.begin()) out += ',';
                    out += nlohmann::json(it.key()).dump();
                    out += ':';
                    out += canonical(it.value());
                }
                return out + "}";
            }
            case nlohmann::json::value_t::array: {
                std::string out = "[";
                for (auto it = body.begin(); it != body.end(); ++it) {
                    if (it != body.begin()) out += ',';
                    out += canonical(*it);
                }
                return out + "]";
            }
            case nlohmann::json::value_t::number_float:
                return jsNumber(body.get<double>());
            default:
                return body.dump();
        }
    }

    /**
     * @brief Кратчайшие цифры берутся из dump(), нотация из Number#toString
     */
    static std::string jsNumber(double value) {
        std::string text = nlohmann::json(value).dump();
        if (text == "null") {
            return text;
        }

        std::string sign;
        if (text[0] == '-') {
            sign = "-";
            text.erase(0, 1);
        }

        int exponent = 0;
        auto e = text.find('e');
        if (e != std::string::npos) {
            exponent = std::stoi(text.substr(e + 1));
            text.erase(e);
        }

        auto dot = text.find('.');
        std::string intPart = dot == std::string::npos ? text : text.substr(0, dot);
        std::string digits = dot == std::string::npos ? text : intPart + text.substr(dot + 1);

        // value = 0.digits * 10^n
        int n = static_cast<int>(intPart.size()) + exponent;
        auto lead = digits.find_first_not_of('0');
        if (lead == std::string::npos) {
            return "0";
        }
        n -= static_cast<int>(lead);
        digits.erase(0, lead);
        digits.erase(digits.find_last_not_of('0') + 1);
        int k = static_cast<int>(digits.size());

        std::string out;
        if (k <= n && n <= 21) {
            out = digits + std::string(n - k, '0');
        } else if (0 < n && n <= 21) {
            out = digits.substr(0, n) + "." + digits.substr(n);
        } else if (-6 < n && n <= 0) {
            out = "0." + std::string(-n, '0') + digits;
        } else {
            int shown = n - 1;
            out = digits.substr(0, 1);
            if (k > 1) out += "." + digits.substr(1);
            out += shown < 0 ? "e-" : "e+";
            out += std::to_string(shown < 0 ? -shown : shown);
        }
        return sign + out;
    }

    std::string sign(const std::string& payload) const {
        unsigned char mac[EVP_MAX_MD_SIZE];
        unsigned int macSize = 0;
        HMAC(EVP_sha512(), secret_.data(), static_cast<int>(secret_.size()),
             reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
             mac, &macSize);

        std::ostringstream hex;
        for (unsigned int i = 0; i < macSize; ++i) {
            hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(mac[i]);
        }
        return hex.str();
    }

    bool verify(const nlohmann::json& body, const std::string& signature) const {
        if (secret_.empty() || signature.empty()) {
            return false;
        }

        std::string expected = sign(canonical(body));
        std::string actual = signature;
        std::transform(actual.begin(), actual.end(), actual.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (actual.size() != expected.size()) {
            return false;
        }
        return CRYPTO_memcmp(expected.data(), actual.data(), expected.size()) == 0;
    }

private:
    std::string secret_;
};

} // namespace checkout::adapters::primary
