#pragma once

#include <string>
#include <cstdint>

namespace checkout::ports::output {

/**
 * @brief Очередь исходящих уведомлений
 *
 * Постановка в очередь не блокирует и не бросает: доставка идёт в фоне,
 * а её сбои видны только в логах и счётчиках.
 */
class INotificationOutbox {
public:
    virtual ~INotificationOutbox() = default;

    virtual void notifyBuyer(int64_t buyerId, const std::string& text) = 0;

    virtual void raiseOperatorAlert(const std::string& kind,
                                    const std::string& paymentId,
                                    const std::string& details) = 0;
};

} // namespace checkout::ports::output
