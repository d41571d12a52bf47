#include "TaskPool.hpp"

#include <exception>
#include <iostream>

TaskPool::TaskPool(std::string name, size_t workers, size_t queueCapacity)
    : name_(std::move(name))
    , queue_(queueCapacity)
{
    if (workers == 0) {
        workers = 1;
    }
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
}

TaskPool::~TaskPool() {
    shutdown();
}

bool TaskPool::submit(std::shared_ptr<ICommand> command) {
    if (!command || stopped_.load()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(idleMutex_);
        ++pending_;
    }

    if (!queue_.tryPush(std::move(command))) {
        finishOne();
        return false;
    }
    return true;
}

bool TaskPool::submit(std::function<void()> task) {
    return submit(std::make_shared<LambdaCommand>(std::move(task)));
}

bool TaskPool::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idleMutex_);
    return idleCv_.wait_for(lock, timeout, [this]() { return pending_ == 0; });
}

void TaskPool::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }

    queue_.shutdown();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t TaskPool::pending() const {
    std::lock_guard<std::mutex> lock(idleMutex_);
    return pending_;
}

void TaskPool::workerLoop() {
    while (true) {
        auto command = queue_.pop();
        if (!command) {
            return;  // очередь закрыта и пуста
        }

        try {
            command->execute();
            ++completed_;
        } catch (const std::exception& e) {
            ++failed_;
            std::cerr << "[TaskPool:" << name_ << "] Task failed: " << e.what() << std::endl;
        }

        finishOne();
    }
}

void TaskPool::finishOne() {
    {
        std::lock_guard<std::mutex> lock(idleMutex_);
        --pending_;
    }
    idleCv_.notify_all();
}
