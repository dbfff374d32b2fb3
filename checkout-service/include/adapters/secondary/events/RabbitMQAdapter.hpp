#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <iostream>

namespace checkout::adapters::secondary {

/**
 * @brief Публикация событий в RabbitMQ
 *
 * Exchange: topic (checkout.events), durable.
 * Routing keys: buyer.notification, operator.alert
 *
 * AMQP соединение живёт в собственном потоке с io_context; publish()
 * передаёт сообщение в этот поток и ждёт результат. Ошибка публикации
 * бросается наружу, повтор делает NotificationOutbox.
 */
class RabbitMQAdapter : public ports::output::IEventPublisher {
public:
    static constexpr std::chrono::seconds PUBLISH_TIMEOUT{5};

    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , exchangeName_(settings_->getExchange())
        , running_(false)
        , ready_(false)
        , ioContext_()
        , handler_(ioContext_)
    {
        std::cout << "[RabbitMQAdapter] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_ << std::endl;
        start();
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    /**
     * @throws std::runtime_error если канал не готов или брокер отверг сообщение
     */
    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_ || !ready_) {
            throw std::runtime_error("RabbitMQ is not connected");
        }

        auto done = std::make_shared<std::promise<bool>>();
        auto result = done->get_future();
        boost::asio::post(ioContext_, [this, done, routingKey, message]() {
            if (!channel_ || !ready_) {
                done->set_value(false);
                return;
            }
            done->set_value(channel_->publish(exchangeName_, routingKey, message));
        });

        if (result.wait_for(PUBLISH_TIMEOUT) != std::future_status::ready) {
            throw std::runtime_error("RabbitMQ publish timed out");
        }
        if (!result.get()) {
            throw std::runtime_error("RabbitMQ rejected message for " + routingKey);
        }

        std::cout << "[RabbitMQAdapter] Published " << routingKey
                  << ": " << message.substr(0, 100) << std::endl;
    }

    void start() {
        if (running_) return;
        running_ = true;

        workGuard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(ioContext_));
        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                ready_ = false;
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    void stop() {
        if (!running_) return;
        running_ = false;
        ready_ = false;

        workGuard_.reset();
        ioContext_.stop();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

    bool isReady() const { return ready_; }

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    void connect() {
        std::string connStr = "amqp://" + settings_->getUser() + ":" +
                              settings_->getPassword() + "@" +
                              settings_->getHost() + ":" +
                              std::to_string(settings_->getPort()) + "/";

        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_, AMQP::Address(connStr));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([this](const char* msg) {
            ready_ = false;
            std::cerr << "[RabbitMQAdapter] Channel error: " << msg << std::endl;
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                ready_ = true;
                std::cout << "[RabbitMQAdapter] Exchange declared: " << exchangeName_ << std::endl;
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange error: " << msg << std::endl;
            });
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;

    std::atomic<bool> running_;
    std::atomic<bool> ready_;
    boost::asio::io_context ioContext_;
    AMQP::LibBoostAsioHandler handler_;
    std::unique_ptr<WorkGuard> workGuard_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;
};

} // namespace checkout::adapters::secondary
