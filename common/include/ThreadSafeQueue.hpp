#pragma once

#include "ICommand.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Ограниченная потокобезопасная очередь команд
 * @details
 * Производитель никогда не блокируется: при заполнении очереди tryPush()
 * возвращает false и решение о потере команды принимает вызывающий код.
 * Потребитель блокируется в pop() до появления команды или закрытия очереди.
 */
class ThreadSafeQueue {
private:
    std::queue<std::shared_ptr<ICommand>> queue_;  ///< Внутренняя очередь
    mutable std::mutex mutex_;                     ///< Мьютекс для синхронизации
    std::condition_variable condVar_;              ///< Условная переменная для ожидания
    size_t capacity_;                              ///< Ёмкость (0 без ограничения)
    bool shutdown_ = false;                        ///< Флаг завершения работы очереди

public:
    /**
     * @param capacity Максимальное число команд в очереди, 0 без ограничения
     */
    explicit ThreadSafeQueue(size_t capacity = 0);
    ~ThreadSafeQueue();

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Добавить команду, не блокируясь
     * @return false, если очередь заполнена, закрыта или command == nullptr
     */
    bool tryPush(std::shared_ptr<ICommand> command);

    /**
     * @brief Извлечь команду из очереди (блокирующий вызов)
     * @return команда либо nullptr, если очередь закрыта и пуста
     */
    std::shared_ptr<ICommand> pop();

    /**
     * @brief Закрыть очередь и пробудить все ожидающие потоки
     * @details Уже принятые команды остаются доступны для pop().
     */
    void shutdown();

    bool isShutdown() const;

    bool isEmpty() const;

    size_t size() const;

    size_t capacity() const { return capacity_; }
};
