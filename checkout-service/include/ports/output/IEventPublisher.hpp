#pragma once

#include <string>

namespace checkout::ports::output {

/**
 * @brief Интерфейс для публикации событий
 *
 * Реализуется RabbitMQAdapter.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "buyer.notification")
     * @param message JSON-сообщение
     * @throws std::runtime_error если брокер недоступен
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace checkout::ports::output
