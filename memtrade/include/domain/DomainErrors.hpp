#pragma once

#include <stdexcept>
#include <string>

namespace memtrade::domain {

/**
 * @brief Недопустимый переход конечного автомата Order/Deal
 */
class StateTransitionError : public std::logic_error {
public:
    explicit StateTransitionError(const std::string& message)
        : std::logic_error(message) {}
};

/**
 * @brief Нарушение инварианта сущности или связи между сущностями
 *
 * Например, попытка привязать к сделке второй открытый ордер на покупку
 * или уменьшить исполненный объём ордера.
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace memtrade::domain
