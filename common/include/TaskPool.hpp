#pragma once

#include "ThreadSafeQueue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @file TaskPool.hpp
 * @brief Пул рабочих потоков поверх ограниченной ThreadSafeQueue
 * @details
 * Учитывает все принятые, но ещё не завершённые задачи, чтобы при остановке
 * можно было дождаться их выполнения (waitIdle) вместо потери фоновой работы.
 * Исключение, выброшенное задачей, логируется и учитывается в failedTasks(),
 * рабочий поток при этом продолжает работу.
 *
 * @example
 * ```cpp
 * TaskPool pool("sync", 2, 1000);
 * pool.submit([] { store->upsert(order); });
 * pool.waitIdle(std::chrono::seconds(5));
 * pool.shutdown();
 * ```
 */
class TaskPool {
public:
    /**
     * @param name Имя пула для логов
     * @param workers Количество рабочих потоков (минимум 1)
     * @param queueCapacity Ёмкость очереди, 0 без ограничения
     */
    TaskPool(std::string name, size_t workers, size_t queueCapacity);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /**
     * @brief Поставить задачу в очередь, не блокируясь
     * @return false, если очередь заполнена или пул остановлен
     */
    bool submit(std::shared_ptr<ICommand> command);
    bool submit(std::function<void()> task);

    /**
     * @brief Дождаться завершения всех принятых задач
     * @return true, если все задачи завершились до истечения таймаута
     */
    bool waitIdle(std::chrono::milliseconds timeout);

    /**
     * @brief Закрыть очередь, выполнить оставшиеся задачи и остановить потоки
     */
    void shutdown();

    /// Принятые, но ещё не завершённые задачи (в очереди и выполняющиеся)
    size_t pending() const;

    uint64_t completedTasks() const { return completed_.load(); }
    uint64_t failedTasks() const { return failed_.load(); }
    const std::string& name() const { return name_; }

private:
    void workerLoop();
    void finishOne();

    std::string name_;
    ThreadSafeQueue queue_;
    std::vector<std::thread> workers_;

    mutable std::mutex idleMutex_;
    std::condition_variable idleCv_;
    size_t pending_ = 0;

    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<bool> stopped_{false};
};
