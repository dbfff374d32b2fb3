#pragma once

#include "ports/output/IInventoryRepository.hpp"
#include "ports/output/IClock.hpp"
#include "settings/ICheckoutSettings.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace checkout::application {

/**
 * @brief Фоновый поток, снимающий просроченные резервы корзин
 *
 * Запись с reservedAt = T снимается первым тиком в момент T + TTL или позже.
 * Каждая строка снимается отдельной транзакцией в IInventoryRepository
 * под той же блокировкой строки товара, что и финализация покупки.
 */
class BasketExpirySweeper {
public:
    BasketExpirySweeper(
        std::shared_ptr<ports::output::IInventoryRepository> inventory,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::ICheckoutSettings> settings
    ) : inventory_(std::move(inventory))
      , clock_(std::move(clock))
      , ttl_(settings->getReservationTtl())
      , interval_(settings->getSweepInterval())
      , running_(false)
      , tickCount_(0)
      , releasedTotal_(0)
    {}

    ~BasketExpirySweeper() {
        stop();
    }

    BasketExpirySweeper(const BasketExpirySweeper&) = delete;
    BasketExpirySweeper& operator=(const BasketExpirySweeper&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        thread_ = std::thread([this]() {
            std::unique_lock<std::mutex> lock(mutex_);
            while (running_) {
                lock.unlock();
                doTick();
                lock.lock();
                wakeup_.wait_for(lock, interval_, [this]() { return !running_; });
            }
        });
        std::cout << "[BasketExpirySweeper] Started, every " << interval_.count()
                  << "s, TTL " << ttl_.count() << "s" << std::endl;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            running_ = false;
        }
        wakeup_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        std::cout << "[BasketExpirySweeper] Stopped after " << tickCount_.load() << " ticks" << std::endl;
    }

    bool isRunning() const { return running_; }

    uint64_t tickCount() const { return tickCount_; }

    uint64_t releasedTotal() const { return releasedTotal_; }

    /**
     * @brief Выполнить один проход вручную (для тестов)
     * @return число снятых резервов
     */
    int manualTick() {
        return doTick();
    }

private:
    std::shared_ptr<ports::output::IInventoryRepository> inventory_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::chrono::seconds ttl_;
    std::chrono::seconds interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> tickCount_;
    std::atomic<uint64_t> releasedTotal_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wakeup_;

    int doTick() {
        int released = 0;
        try {
            released = inventory_->releaseExpired(clock_->now() - ttl_);
            if (released > 0) {
                std::cout << "[BasketExpirySweeper] Released " << released << " expired reservations" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[BasketExpirySweeper] Sweep failed: " << e.what() << std::endl;
        }
        releasedTotal_ += released;
        ++tickCount_;
        return released;
    }
};

} // namespace checkout::application
