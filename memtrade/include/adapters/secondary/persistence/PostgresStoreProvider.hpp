#pragma once

#include "PostgresDealStore.hpp"
#include "PostgresOrderStore.hpp"
#include "ports/output/IDurableStoreProvider.hpp"
#include "settings/DbSettings.hpp"

#include <memory>

namespace memtrade::adapters::secondary {

/**
 * @brief Создаёт хранилища PostgreSQL по DbSettings
 *
 * Каждое хранилище получает своё соединение.
 */
class PostgresStoreProvider : public ports::output::IDurableStoreProvider {
public:
    explicit PostgresStoreProvider(const settings::DbSettings& settings)
        : connectionString_(settings.getConnectionString())
    {}

    std::shared_ptr<ports::output::IOrderStore> createOrderStore() override {
        return std::make_shared<PostgresOrderStore>(connectionString_);
    }

    std::shared_ptr<ports::output::IDealStore> createDealStore() override {
        return std::make_shared<PostgresDealStore>(connectionString_);
    }

private:
    std::string connectionString_;
};

} // namespace memtrade::adapters::secondary
