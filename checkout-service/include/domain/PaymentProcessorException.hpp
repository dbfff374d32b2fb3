#pragma once

#include "enums/ProcessorErrorKind.hpp"
#include <stdexcept>
#include <string>

namespace checkout::domain {

/**
 * @brief Ошибка обращения к платёжному процессору
 */
class PaymentProcessorException : public std::runtime_error {
public:
    PaymentProcessorException(ProcessorErrorKind kind, const std::string& message, int httpStatus = 0)
        : std::runtime_error(message), kind_(kind), httpStatus_(httpStatus) {}

    ProcessorErrorKind kind() const { return kind_; }
    int httpStatus() const { return httpStatus_; }

private:
    ProcessorErrorKind kind_;
    int httpStatus_;
};

} // namespace checkout::domain
