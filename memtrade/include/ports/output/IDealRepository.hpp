#pragma once

#include "domain/Deal.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace memtrade::ports::output {

/**
 * @brief Порт для хранения сделок
 */
class IDealRepository {
public:
    using Predicate = std::function<bool(const domain::Deal&)>;

    virtual ~IDealRepository() = default;

    virtual domain::Deal save(const domain::Deal& deal) = 0;

    virtual std::optional<domain::Deal> findById(int64_t id) const = 0;

    /**
     * @brief Нефинальные сделки (ACTIVE, WAITING_SELL)
     */
    virtual std::vector<domain::Deal> findActive() const = 0;

    virtual std::vector<domain::Deal> findBySymbol(const std::string& symbol) const = 0;

    virtual std::vector<domain::Deal> scan(const Predicate& predicate) const = 0;

    virtual std::vector<domain::Deal> findAll() const = 0;

    virtual bool deleteById(int64_t id) = 0;

    virtual size_t count() const = 0;
};

} // namespace memtrade::ports::output
