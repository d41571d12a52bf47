#pragma once

#include "PostgresConnection.hpp"
#include "ports/output/IDurableStoreProvider.hpp"

#include <pqxx/pqxx>

#include <string>
#include <vector>

namespace memtrade::adapters::secondary {

/**
 * @brief Копия таблицы сделок в PostgreSQL
 */
class PostgresDealStore : public ports::output::IDealStore {
public:
    /**
     * @throws std::exception если БД недоступна
     */
    explicit PostgresDealStore(const std::string& connectionString)
        : db_(connectionString, "PostgresDealStore")
    {}

    void ensureSchema() override;

    void upsert(const domain::Deal& deal) override;

    void remove(int64_t id) override;

    void replaceAll(const std::vector<domain::Deal>& deals) override;

    std::vector<domain::Deal> loadAll() override;

private:
    static void upsertIn(pqxx::work& txn, const domain::Deal& deal);
    static domain::Deal rowToDeal(const pqxx::row& row);

    PostgresConnection db_;
};

} // namespace memtrade::adapters::secondary
