#pragma once

#include <functional>
#include <utility>

/**
 * @file ICommand.hpp
 * @brief Интерфейс команды по паттерну Command
 */

/**
 * @brief Единица фоновой работы, помещаемая в ThreadSafeQueue
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws std::exception если команду невозможно выполнить
     */
    virtual void execute() = 0;
};

/**
 * @brief Команда-обёртка над произвольной функцией
 */
class LambdaCommand : public ICommand {
public:
    explicit LambdaCommand(std::function<void()> body) : body_(std::move(body)) {}

    void execute() override {
        if (body_) {
            body_();
        }
    }

private:
    std::function<void()> body_;
};
