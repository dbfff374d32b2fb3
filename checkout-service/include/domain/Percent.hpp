#pragma once

#include "Money.hpp"
#include <string>

namespace checkout::domain {

/**
 * @brief Процент с той же точностью, что и Money (10^-9)
 *
 * Percent(10) означает 10%.
 */
class Percent {
public:
    Percent() = default;

    explicit Percent(const Money& raw) : raw_(Money::fromNanos(raw.totalNanos(), "%")) {}

    static Percent of(int64_t whole) {
        return Percent(Money(whole, 0, "%"));
    }

    static Percent parse(const std::string& text) {
        return Percent(Money::parse(text, "%"));
    }

    /**
     * @brief amount * percent / 100, точно до 10^-9, без округления до центов
     */
    Money applyTo(const Money& amount) const {
        __int128 hundred = static_cast<__int128>(100) * Money::NANO;
        return Money::fromNanos(amount.totalNanos() * raw_.totalNanos() / hundred, amount.currency);
    }

    bool isZero() const { return raw_.isZero(); }
    bool isPositive() const { return raw_.isPositive(); }

    std::string toString() const { return raw_.toString(); }

    bool operator==(const Percent& other) const { return raw_ == other.raw_; }

private:
    Money raw_ = Money::zero("%");
};

} // namespace checkout::domain
