#pragma once

#include <string>
#include <optional>

namespace checkout::domain {

enum class CheckoutMethod {
    BALANCE,
    CRYPTO
};

inline std::string toString(CheckoutMethod method) {
    switch (method) {
        case CheckoutMethod::BALANCE: return "balance";
        case CheckoutMethod::CRYPTO: return "crypto";
        default: return "unknown";
    }
}

inline std::optional<CheckoutMethod> parseCheckoutMethod(const std::string& str) {
    if (str == "balance") return CheckoutMethod::BALANCE;
    if (str == "crypto") return CheckoutMethod::CRYPTO;
    return std::nullopt;
}

} // namespace checkout::domain
