#pragma once

#include "PostgresConnection.hpp"
#include "ports/output/IDurableStoreProvider.hpp"

#include <pqxx/pqxx>

#include <memory>
#include <string>
#include <vector>

namespace memtrade::adapters::secondary {

/**
 * @brief Копия таблицы ордеров в PostgreSQL
 *
 * Суммы хранятся в NUMERIC и передаются строками, время миллисекундами.
 */
class PostgresOrderStore : public ports::output::IOrderStore {
public:
    /**
     * @throws std::exception если БД недоступна
     */
    explicit PostgresOrderStore(const std::string& connectionString)
        : db_(connectionString, "PostgresOrderStore")
    {}

    void ensureSchema() override;

    void upsert(const domain::Order& order) override;

    void remove(int64_t id) override;

    void replaceAll(const std::vector<domain::Order>& orders) override;

    std::vector<domain::Order> loadAll() override;

private:
    static void upsertIn(pqxx::work& txn, const domain::Order& order);
    static domain::Order rowToOrder(const pqxx::row& row);

    PostgresConnection db_;
};

} // namespace memtrade::adapters::secondary
