#pragma once

#include "domain/ChatReply.hpp"
#include "domain/enums/SessionState.hpp"
#include <string>
#include <cstdint>

namespace checkout::ports::input {

/**
 * @brief Конечный автомат чат-сессии покупателя
 */
class IChatSessionService {
public:
    virtual ~IChatSessionService() = default;

    /**
     * @brief Свободный текст от покупателя, маршрутизируется по текущему состоянию
     */
    virtual domain::ChatReply handleMessage(int64_t buyerId, const std::string& text) = 0;

    /**
     * @brief Перейти в состояние ожидания ввода: "apply_discount", "top_up", "cancel"
     */
    virtual domain::ChatReply enter(int64_t buyerId, const std::string& action) = 0;

    virtual domain::SessionState state(int64_t buyerId) const = 0;
};

} // namespace checkout::ports::input
