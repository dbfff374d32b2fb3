#pragma once

#include "domain/DiscountCode.hpp"
#include <optional>
#include <string>

namespace checkout::ports::output {

class IDiscountCodeRepository {
public:
    virtual ~IDiscountCodeRepository() = default;
    virtual std::optional<domain::DiscountCode> find(const std::string& code) = 0;
};

} // namespace checkout::ports::output
