#pragma once

#include <string>
#include <stdexcept>

namespace memtrade::domain {

/**
 * @brief Вид репозитория, которым управляет RepositoryFactory
 */
enum class RepositoryKind {
    ORDERS,
    DEALS,
    TICKERS,
    ORDER_BOOKS,
    INDICATORS
};

inline std::string toString(RepositoryKind kind) {
    switch (kind) {
        case RepositoryKind::ORDERS:      return "orders";
        case RepositoryKind::DEALS:       return "deals";
        case RepositoryKind::TICKERS:     return "tickers";
        case RepositoryKind::ORDER_BOOKS: return "order_books";
        case RepositoryKind::INDICATORS:  return "indicators";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline RepositoryKind repositoryKindFromString(const std::string& str) {
    if (str == "orders")      return RepositoryKind::ORDERS;
    if (str == "deals")       return RepositoryKind::DEALS;
    if (str == "tickers")     return RepositoryKind::TICKERS;
    if (str == "order_books") return RepositoryKind::ORDER_BOOKS;
    if (str == "indicators")  return RepositoryKind::INDICATORS;
    throw std::invalid_argument("Unknown RepositoryKind: " + str);
}

} // namespace memtrade::domain
