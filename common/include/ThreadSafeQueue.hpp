#pragma once

#include "ICommand.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная очередь команд
 * @details
 * Блокирующий pop() для рабочего потока и shutdown() для остановки.
 * После shutdown() новые команды не принимаются, а уже поставленные
 * ещё выдаются через pop(), пока очередь не опустеет.
 */
class ThreadSafeQueue {
private:
    std::queue<std::shared_ptr<ICommand>> queue_;  ///< Внутренняя очередь
    mutable std::mutex mutex_;                     ///< Мьютекс для синхронизации
    std::condition_variable condVar_;              ///< Условная переменная для ожидания
    bool shutdown_ = false;                        ///< Флаг завершения работы очереди

public:
    ThreadSafeQueue();
    ~ThreadSafeQueue();

    /**
     * @brief Добавить команду в очередь
     * @return false, если очередь уже закрыта и команда отброшена
     */
    bool push(std::shared_ptr<ICommand> command);

    /**
     * @brief Извлечь команду из очереди (блокирующий вызов)
     * @return команда, либо nullptr, если очередь закрыта и пуста
     */
    std::shared_ptr<ICommand> pop();

    /**
     * @brief Закрыть очередь и пробудить все ожидающие потоки
     */
    void shutdown();

    bool isShutdown() const;

    bool isEmpty() const;

    size_t size() const;
};
