#pragma once

#include "PaymentIntent.hpp"
#include "enums/SessionState.hpp"
#include <string>
#include <optional>

namespace checkout::domain {

/**
 * @brief Ответ чат-сессии: текст покупателю и состояние после обработки
 *
 * intent заполнен, когда сообщение привело к открытию платежа на пополнение.
 */
struct ChatReply {
    SessionState state = SessionState::IDLE;
    std::string text;
    bool accepted = true;
    std::optional<PaymentIntent> intent;
};

} // namespace checkout::domain
