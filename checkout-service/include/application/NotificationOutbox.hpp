#pragma once

#include "ports/output/INotificationOutbox.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "settings/ICheckoutSettings.hpp"
#include "domain/Timestamp.hpp"
#include <ThreadSafeQueue.hpp>
#include <ICommand.hpp>
#include <CommandException.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <iostream>

namespace checkout::application {

/**
 * @brief Публикация одного сообщения в брокер
 */
class PublishCommand : public ICommand {
public:
    PublishCommand(std::shared_ptr<ports::output::IEventPublisher> publisher,
                   std::string routingKey,
                   std::string payload)
        : publisher_(std::move(publisher))
        , routingKey_(std::move(routingKey))
        , payload_(std::move(payload)) {}

    void execute() override {
        ++attempts_;
        try {
            publisher_->publish(routingKey_, payload_);
        } catch (const std::exception& e) {
            throw CommandException(routingKey_ + ": " + e.what());
        }
    }

    std::string describe() const override { return routingKey_; }
    int attempts() const override { return attempts_; }

private:
    std::shared_ptr<ports::output::IEventPublisher> publisher_;
    std::string routingKey_;
    std::string payload_;
    int attempts_ = 0;
};

/**
 * @brief Outbox уведомлений покупателю и алертов оператору
 *
 * Сообщения ставятся в ThreadSafeQueue и доставляются одним рабочим потоком.
 * Каждое сообщение пробуется до OUTBOX_MAX_ATTEMPTS раз, затем считается
 * проваленным. Транзакции, породившие уведомление, к этому моменту уже
 * зафиксированы и от доставки не зависят.
 *
 * Routing keys: buyer.notification, operator.alert
 */
class NotificationOutbox : public ports::output::INotificationOutbox {
public:
    static constexpr const char* BUYER_NOTIFICATION = "buyer.notification";
    static constexpr const char* OPERATOR_ALERT = "operator.alert";

    NotificationOutbox(
        std::shared_ptr<ports::output::IEventPublisher> publisher,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : publisher_(std::move(publisher))
      , maxAttempts_(settings->getOutboxMaxAttempts())
    {
        worker_ = std::thread([this]() { run(); });
        std::cout << "[NotificationOutbox] Started, max attempts " << maxAttempts_ << std::endl;
    }

    ~NotificationOutbox() override {
        stop();
    }

    NotificationOutbox(const NotificationOutbox&) = delete;
    NotificationOutbox& operator=(const NotificationOutbox&) = delete;

    void notifyBuyer(int64_t buyerId, const std::string& text) override {
        nlohmann::json message;
        message["buyer_id"] = buyerId;
        message["text"] = text;
        message["created_at"] = domain::Timestamp::now().toString();
        enqueue(BUYER_NOTIFICATION, message.dump());
    }

    void raiseOperatorAlert(const std::string& kind,
                            const std::string& paymentId,
                            const std::string& details) override {
        nlohmann::json message;
        message["kind"] = kind;
        message["payment_id"] = paymentId;
        message["details"] = details;
        message["created_at"] = domain::Timestamp::now().toString();
        enqueue(OPERATOR_ALERT, message.dump());
    }

    /**
     * @brief Закрыть очередь, доставить оставшееся и остановить поток
     */
    void stop() {
        queue_.shutdown();
        if (worker_.joinable()) {
            worker_.join();
            std::cout << "[NotificationOutbox] Stopped: delivered=" << delivered_.load()
                      << " failed=" << failed_.load() << std::endl;
        }
    }

    uint64_t delivered() const { return delivered_; }
    uint64_t failed() const { return failed_; }
    uint64_t dropped() const { return dropped_; }
    size_t pending() const { return queue_.size(); }

private:
    std::shared_ptr<ports::output::IEventPublisher> publisher_;
    int maxAttempts_;
    ThreadSafeQueue queue_;
    std::thread worker_;
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};

    void enqueue(const std::string& routingKey, const std::string& payload) {
        auto command = std::make_shared<PublishCommand>(publisher_, routingKey, payload);
        if (!queue_.push(command)) {
            ++dropped_;
            std::cerr << "[NotificationOutbox] Queue closed, dropped " << routingKey
                      << ": " << payload << std::endl;
        }
    }

    void run() {
        while (auto command = queue_.pop()) {
            deliver(*command);
        }
    }

    void deliver(ICommand& command) {
        for (int attempt = 1; attempt <= maxAttempts_; ++attempt) {
            try {
                command.execute();
                ++delivered_;
                return;
            } catch (const CommandException& e) {
                std::cerr << "[NotificationOutbox] Attempt " << command.attempts() << "/" << maxAttempts_
                          << " failed for " << command.describe() << ": " << e.what() << std::endl;
                if (!e.isRetryable()) {
                    break;
                }
                if (attempt < maxAttempts_) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50 * attempt));
                }
            }
        }
        ++failed_;
        std::cerr << "[NotificationOutbox] Giving up on " << command.describe() << std::endl;
    }
};

} // namespace checkout::application
