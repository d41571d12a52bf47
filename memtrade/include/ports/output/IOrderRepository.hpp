#pragma once

#include "domain/Order.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace memtrade::ports::output {

/**
 * @brief Порт для хранения ордеров
 *
 * Все операции синхронные и работают с памятью; возвращаются копии.
 * Ордер изменяется только через save().
 */
class IOrderRepository {
public:
    using Predicate = std::function<bool(const domain::Order&)>;

    virtual ~IOrderRepository() = default;

    /**
     * @brief Вставить или заменить ордер по id
     * @return Сохранённая копия (с назначенным id, если он был 0)
     */
    virtual domain::Order save(const domain::Order& order) = 0;

    virtual std::optional<domain::Order> findById(int64_t id) const = 0;

    virtual std::optional<domain::Order> findByExchangeId(const std::string& exchangeId) const = 0;

    /**
     * @brief Открытые ордера (PLACED, PARTIALLY_FILLED)
     */
    virtual std::vector<domain::Order> findOpen() const = 0;

    virtual std::vector<domain::Order> findOpenBySide(domain::OrderSide side) const = 0;

    virtual std::vector<domain::Order> findByDeal(int64_t dealId) const = 0;

    virtual std::vector<domain::Order> findByStatus(domain::OrderStatus status) const = 0;

    virtual std::vector<domain::Order> scan(const Predicate& predicate) const = 0;

    virtual std::vector<domain::Order> findAll() const = 0;

    virtual bool deleteById(int64_t id) = 0;

    virtual size_t count() const = 0;
};

} // namespace memtrade::ports::output
