#pragma once

#include <string>

/**
 * @file ICommand.hpp
 * @brief Интерфейс команды по паттерну Command
 */

/**
 * @brief Единица отложенной работы
 *
 * Команды ставятся в ThreadSafeQueue и исполняются рабочим потоком
 * (например, доставка уведомлений из outbox). Команда сама знает,
 * сколько раз её уже пытались исполнить, чтобы исполнитель мог
 * ограничить число повторов.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws CommandException если команду невозможно выполнить
     */
    virtual void execute() = 0;

    /**
     * @brief Короткое имя для логов, например "buyer.notification#42"
     */
    virtual std::string describe() const = 0;

    /**
     * @brief Сколько попыток исполнения уже было
     */
    virtual int attempts() const = 0;
};
