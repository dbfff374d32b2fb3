#pragma once

#include "domain/enums/SessionState.hpp"
#include "domain/Money.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <cstdint>

namespace checkout::application {

/**
 * @brief Состояние одного покупателя в памяти процесса
 *
 * Все поля читаются и пишутся только под mutex.
 * chatMutex держится на всё время обработки одного сообщения чата,
 * чтобы сообщения одного покупателя не перемешивали переходы автомата.
 */
struct BuyerSession {
    std::mutex mutex;
    std::mutex chatMutex;
    domain::SessionState state = domain::SessionState::IDLE;
    std::string appliedDiscountCode;
    std::optional<domain::Money> pendingTopUpAmount;
};

/**
 * @brief Реестр сессий покупателей
 *
 * Общий для корзины (применённый скидочный код) и чат-автомата.
 */
class SessionRegistry {
public:
    std::shared_ptr<BuyerSession> session(int64_t buyerId) {
        return sessions_.findOrCreate(buyerId, []() { return std::make_shared<BuyerSession>(); });
    }

    std::string appliedCode(int64_t buyerId) {
        auto s = session(buyerId);
        std::lock_guard<std::mutex> lock(s->mutex);
        return s->appliedDiscountCode;
    }

    void setAppliedCode(int64_t buyerId, const std::string& code) {
        auto s = session(buyerId);
        std::lock_guard<std::mutex> lock(s->mutex);
        s->appliedDiscountCode = code;
    }

    /**
     * @brief Снять код, только если он всё ещё тот же (не затереть новый)
     */
    void dropAppliedCode(int64_t buyerId, const std::string& expected) {
        auto s = session(buyerId);
        std::lock_guard<std::mutex> lock(s->mutex);
        if (s->appliedDiscountCode == expected) {
            s->appliedDiscountCode.clear();
        }
    }

    size_t size() const { return sessions_.size(); }

private:
    ThreadSafeMap<int64_t, BuyerSession> sessions_;
};

} // namespace checkout::application
