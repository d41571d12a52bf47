#pragma once

#include <string>
#include <stdexcept>

namespace memtrade::domain {

/**
 * @brief Статус ордера
 *
 * PENDING → PLACED → {PARTIALLY_FILLED ↔ PLACED} → FILLED
 * PLACED | PARTIALLY_FILLED → CANCELED
 * PENDING | PLACED → REJECTED
 */
enum class OrderStatus {
    PENDING,           ///< Создан локально, на биржу не отправлен
    PLACED,            ///< Принят биржей
    PARTIALLY_FILLED,  ///< Исполнен частично
    FILLED,            ///< Исполнен полностью
    CANCELED,          ///< Отменён
    REJECTED           ///< Отклонён биржей
};

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING:          return "PENDING";
        case OrderStatus::PLACED:           return "PLACED";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED:           return "FILLED";
        case OrderStatus::CANCELED:         return "CANCELED";
        case OrderStatus::REJECTED:         return "REJECTED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderStatus orderStatusFromString(const std::string& str) {
    if (str == "PENDING")          return OrderStatus::PENDING;
    if (str == "PLACED")           return OrderStatus::PLACED;
    if (str == "PARTIALLY_FILLED") return OrderStatus::PARTIALLY_FILLED;
    if (str == "FILLED")           return OrderStatus::FILLED;
    if (str == "CANCELED")         return OrderStatus::CANCELED;
    if (str == "REJECTED")         return OrderStatus::REJECTED;
    throw std::invalid_argument("Unknown OrderStatus: " + str);
}

/**
 * @brief Является ли статус финальным (ордер больше не может измениться)
 */
inline bool isFinalStatus(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELED ||
           status == OrderStatus::REJECTED;
}

/**
 * @brief Выставлен ли ордер на бирже и ожидает исполнения
 */
inline bool isOpenStatus(OrderStatus status) {
    return status == OrderStatus::PLACED ||
           status == OrderStatus::PARTIALLY_FILLED;
}

/**
 * @brief Таблица допустимых переходов
 */
inline bool canTransition(OrderStatus from, OrderStatus to) {
    switch (from) {
        case OrderStatus::PENDING:
            return to == OrderStatus::PLACED || to == OrderStatus::REJECTED;
        case OrderStatus::PLACED:
            return to == OrderStatus::PARTIALLY_FILLED || to == OrderStatus::FILLED ||
                   to == OrderStatus::CANCELED || to == OrderStatus::REJECTED;
        case OrderStatus::PARTIALLY_FILLED:
            return to == OrderStatus::PLACED || to == OrderStatus::FILLED ||
                   to == OrderStatus::CANCELED;
        case OrderStatus::FILLED:
        case OrderStatus::CANCELED:
        case OrderStatus::REJECTED:
            return false;
    }
    return false;
}

} // namespace memtrade::domain
