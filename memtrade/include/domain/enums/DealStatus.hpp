#pragma once

#include <string>
#include <stdexcept>

namespace memtrade::domain {

/**
 * @brief Статус сделки (пара покупка/продажа по одному инструменту)
 *
 * ACTIVE → WAITING_SELL → COMPLETED
 * ACTIVE | WAITING_SELL → CANCELED
 * любой нефинальный → FAILED
 */
enum class DealStatus {
    ACTIVE,        ///< Ордер на покупку выставлен или исполняется
    WAITING_SELL,  ///< Покупка исполнена, ожидается продажа
    COMPLETED,
    CANCELED,
    FAILED
};

inline std::string toString(DealStatus status) {
    switch (status) {
        case DealStatus::ACTIVE:       return "ACTIVE";
        case DealStatus::WAITING_SELL: return "WAITING_SELL";
        case DealStatus::COMPLETED:    return "COMPLETED";
        case DealStatus::CANCELED:     return "CANCELED";
        case DealStatus::FAILED:       return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline DealStatus dealStatusFromString(const std::string& str) {
    if (str == "ACTIVE")       return DealStatus::ACTIVE;
    if (str == "WAITING_SELL") return DealStatus::WAITING_SELL;
    if (str == "COMPLETED")    return DealStatus::COMPLETED;
    if (str == "CANCELED")     return DealStatus::CANCELED;
    if (str == "FAILED")       return DealStatus::FAILED;
    throw std::invalid_argument("Unknown DealStatus: " + str);
}

inline bool isFinalStatus(DealStatus status) {
    return status == DealStatus::COMPLETED ||
           status == DealStatus::CANCELED ||
           status == DealStatus::FAILED;
}

} // namespace memtrade::domain
