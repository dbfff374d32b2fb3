#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <pqxx/pqxx>
#include <string>

namespace checkout::adapters::secondary::pg {

// NUMERIC читается как текст, чтобы не проходить через double
inline domain::Money money(const pqxx::field& f, const std::string& currency) {
    if (f.is_null()) return domain::Money::zero(currency);
    return domain::Money::parse(f.as<std::string>(), currency);
}

// колонка должна быть выбрана как EXTRACT(EPOCH FROM ...)::bigint
inline domain::Timestamp timestamp(const pqxx::field& f) {
    return domain::Timestamp::fromEpochSeconds(f.as<int64_t>());
}

inline std::string text(const pqxx::field& f) {
    return f.is_null() ? std::string() : f.as<std::string>();
}

} // namespace checkout::adapters::secondary::pg
