#pragma once

#include <string>
#include <cstdint>
#include <cmath>
#include <stdexcept>
#include <cctype>

namespace checkout::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Фиксированная точка: целая часть и 10^-9 доли. Двоичная плавающая
 * точка используется только при разборе чисел из JSON (fromDouble).
 * Валюта в нижнем регистре: "eur" для расчётной валюты, код актива для крипты.
 */
class Money {
public:
    static constexpr int64_t NANO = 1000000000;

    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть (10^-9), тот же знак, что и units
    std::string currency = "eur";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "eur")
        : units(u), nano(n), currency(cur) {}

    static Money fromNanos(__int128 total, const std::string& cur = "eur") {
        Money m;
        m.currency = cur;
        m.units = static_cast<int64_t>(total / NANO);
        m.nano = static_cast<int32_t>(total % NANO);
        return m;
    }

    static Money fromDouble(double value, const std::string& cur = "eur") {
        return fromNanos(static_cast<__int128>(std::llround(value * 1e9)), cur);
    }

    /**
     * @brief Разобрать десятичную строку ("12.5", "-0.000123", "40")
     * @throws std::invalid_argument если строка не является десятичным числом
     */
    static Money parse(const std::string& text, const std::string& cur = "eur") {
        size_t pos = 0;
        bool negative = false;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
            negative = text[pos] == '-';
            ++pos;
        }

        __int128 whole = 0;
        __int128 frac = 0;
        int fracDigits = 0;
        bool anyDigit = false;

        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            whole = whole * 10 + (text[pos] - '0');
            if (whole > static_cast<__int128>(INT64_MAX)) {
                throw std::invalid_argument("amount out of range: " + text);
            }
            anyDigit = true;
            ++pos;
        }
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (fracDigits < 9) {
                    frac = frac * 10 + (text[pos] - '0');
                    ++fracDigits;
                }
                anyDigit = true;
                ++pos;
            }
        }
        if (!anyDigit || pos != text.size()) {
            throw std::invalid_argument("not a decimal amount: '" + text + "'");
        }
        for (int i = fracDigits; i < 9; ++i) {
            frac *= 10;
        }

        __int128 total = whole * NANO + frac;
        return fromNanos(negative ? -total : total, cur);
    }

    static Money zero(const std::string& cur = "eur") {
        return Money(0, 0, cur);
    }

    __int128 totalNanos() const {
        return static_cast<__int128>(units) * NANO + nano;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    /**
     * @brief Десятичная строка без лишних нулей, минимум два знака после точки
     */
    std::string toString() const {
        __int128 total = totalNanos();
        bool negative = total < 0;
        if (negative) total = -total;

        int64_t whole = static_cast<int64_t>(total / NANO);
        int64_t frac = static_cast<int64_t>(total % NANO);

        std::string fracStr = std::to_string(frac);
        fracStr.insert(0, 9 - fracStr.size(), '0');
        while (fracStr.size() > 2 && fracStr.back() == '0') {
            fracStr.pop_back();
        }

        return (negative ? "-" : "") + std::to_string(whole) + "." + fracStr;
    }

    Money roundDownCents() const {
        constexpr int64_t CENT = NANO / 100;
        __int128 total = totalNanos();
        __int128 rem = total % CENT;
        if (rem < 0) rem += CENT;
        return fromNanos(total - rem, currency);
    }

    Money roundHalfUpCents() const {
        constexpr int64_t CENT = NANO / 100;
        __int128 total = totalNanos();
        bool negative = total < 0;
        if (negative) total = -total;
        __int128 rounded = ((total + CENT / 2) / CENT) * CENT;
        return fromNanos(negative ? -rounded : rounded, currency);
    }

    /**
     * @brief this * numerator / denominator с усечением до 10^-9
     * @throws std::domain_error при нулевом знаменателе
     */
    Money scaled(const Money& numerator, const Money& denominator) const {
        __int128 den = denominator.totalNanos();
        if (den == 0) {
            throw std::domain_error("scaling by zero denominator");
        }
        return fromNanos(totalNanos() * numerator.totalNanos() / den, currency);
    }

    /**
     * @brief Умножить на безразмерный множитель, заданный как Money (например 1.0)
     */
    Money times(const Money& factor) const {
        return fromNanos(totalNanos() * factor.totalNanos() / NANO, currency);
    }

    Money operator+(const Money& other) const {
        return fromNanos(totalNanos() + other.totalNanos(), currency);
    }

    Money operator-(const Money& other) const {
        return fromNanos(totalNanos() - other.totalNanos(), currency);
    }

    Money operator*(int64_t multiplier) const {
        return fromNanos(totalNanos() * multiplier, currency);
    }

    Money& operator+=(const Money& other) {
        *this = *this + other;
        return *this;
    }

    bool isZero() const { return units == 0 && nano == 0; }
    bool isPositive() const { return totalNanos() > 0; }

    bool operator<(const Money& other) const { return totalNanos() < other.totalNanos(); }
    bool operator>(const Money& other) const { return totalNanos() > other.totalNanos(); }
    bool operator<=(const Money& other) const { return totalNanos() <= other.totalNanos(); }
    bool operator>=(const Money& other) const { return totalNanos() >= other.totalNanos(); }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const { return !(*this == other); }
};

inline Money minOf(const Money& a, const Money& b) {
    return a <= b ? a : b;
}

} // namespace checkout::domain
