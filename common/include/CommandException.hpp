#pragma once

#include <stdexcept>
#include <string>

/**
 * @file CommandException.hpp
 * @brief Исключение для команд
 */

/**
 * @brief Ошибка исполнения команды
 *
 * retryable = false означает, что повтор бессмысленен (например,
 * сообщение не сериализуется) и команду нужно сразу считать проваленной.
 */
class CommandException : public std::runtime_error {
public:
    explicit CommandException(const std::string& message, bool retryable = true)
        : std::runtime_error(message), retryable_(retryable) {}

    bool isRetryable() const { return retryable_; }

private:
    bool retryable_;
};
