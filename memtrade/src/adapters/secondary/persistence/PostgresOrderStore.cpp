#include "adapters/secondary/persistence/PostgresOrderStore.hpp"

#include <iostream>

namespace memtrade::adapters::secondary {

void PostgresOrderStore::ensureSchema() {
    db_.inTransaction([](pqxx::work& txn) {
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS orders (
                id                 BIGINT PRIMARY KEY,
                exchange_id        TEXT,
                symbol             TEXT NOT NULL,
                side               TEXT NOT NULL,
                order_type         TEXT NOT NULL,
                price              NUMERIC(38, 9) NOT NULL,
                requested_amount   NUMERIC(38, 9) NOT NULL,
                filled_amount      NUMERIC(38, 9) NOT NULL,
                average_fill_price NUMERIC(38, 9) NOT NULL,
                fees               NUMERIC(38, 9) NOT NULL,
                status             TEXT NOT NULL,
                deal_id            BIGINT,
                created_at_ms      BIGINT NOT NULL,
                updated_at_ms      BIGINT NOT NULL,
                retry_count        INTEGER NOT NULL DEFAULT 0,
                last_error         TEXT
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_orders_deal_id ON orders (deal_id)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_orders_status ON orders (status)");
        txn.exec(R"(
            CREATE UNIQUE INDEX IF NOT EXISTS uq_orders_exchange_id ON orders (exchange_id)
            WHERE exchange_id IS NOT NULL AND status <> 'REJECTED'
        )");
    });
}

void PostgresOrderStore::upsert(const domain::Order& order) {
    db_.inTransaction([&order](pqxx::work& txn) { upsertIn(txn, order); });
}

void PostgresOrderStore::remove(int64_t id) {
    db_.inTransaction([id](pqxx::work& txn) {
        txn.exec_params("DELETE FROM orders WHERE id = $1", id);
    });
}

void PostgresOrderStore::replaceAll(const std::vector<domain::Order>& orders) {
    db_.inTransaction([&orders](pqxx::work& txn) {
        txn.exec("DELETE FROM orders");
        for (const auto& order : orders) {
            upsertIn(txn, order);
        }
    });
    std::cout << "[PostgresOrderStore] Replaced table with " << orders.size() << " orders" << std::endl;
}

std::vector<domain::Order> PostgresOrderStore::loadAll() {
    std::vector<domain::Order> orders;

    db_.inTransaction([&orders](pqxx::work& txn) {
        auto result = txn.exec(R"(
            SELECT id, exchange_id, symbol, side, order_type,
                   price::text AS price, requested_amount::text AS requested_amount,
                   filled_amount::text AS filled_amount,
                   average_fill_price::text AS average_fill_price, fees::text AS fees,
                   status, deal_id, created_at_ms, updated_at_ms, retry_count, last_error
            FROM orders
            ORDER BY id
        )");

        orders.reserve(result.size());
        for (const auto& row : result) {
            orders.push_back(rowToOrder(row));
        }
    });

    return orders;
}

void PostgresOrderStore::upsertIn(pqxx::work& txn, const domain::Order& order) {
    txn.exec_params(
        R"(
            INSERT INTO orders (
                id, exchange_id, symbol, side, order_type,
                price, requested_amount, filled_amount, average_fill_price, fees,
                status, deal_id, created_at_ms, updated_at_ms, retry_count, last_error
            )
            VALUES ($1, $2, $3, $4, $5,
                    $6::numeric, $7::numeric, $8::numeric, $9::numeric, $10::numeric,
                    $11, $12, $13, $14, $15, $16)
            ON CONFLICT (id) DO UPDATE SET
                exchange_id = EXCLUDED.exchange_id,
                price = EXCLUDED.price,
                requested_amount = EXCLUDED.requested_amount,
                filled_amount = EXCLUDED.filled_amount,
                average_fill_price = EXCLUDED.average_fill_price,
                fees = EXCLUDED.fees,
                status = EXCLUDED.status,
                deal_id = EXCLUDED.deal_id,
                updated_at_ms = EXCLUDED.updated_at_ms,
                retry_count = EXCLUDED.retry_count,
                last_error = EXCLUDED.last_error
        )",
        order.id,
        order.exchangeId,
        order.symbol,
        domain::toString(order.side),
        domain::toString(order.type),
        order.price.toString(),
        order.requestedAmount.toString(),
        order.filledAmount.toString(),
        order.averageFillPrice.toString(),
        order.fees.toString(),
        domain::toString(order.status),
        order.dealId,
        order.createdAt.toMillis(),
        order.lastUpdatedAt.toMillis(),
        order.retryCount,
        order.lastError.empty() ? std::optional<std::string>() : std::optional<std::string>(order.lastError)
    );
}

domain::Order PostgresOrderStore::rowToOrder(const pqxx::row& row) {
    domain::Order order;
    order.id = row["id"].as<int64_t>();
    if (!row["exchange_id"].is_null()) {
        order.exchangeId = row["exchange_id"].as<std::string>();
    }
    order.symbol = row["symbol"].as<std::string>();
    order.side = domain::orderSideFromString(row["side"].as<std::string>());
    order.type = domain::orderTypeFromString(row["order_type"].as<std::string>());
    order.price = domain::Decimal::parse(row["price"].as<std::string>());
    order.requestedAmount = domain::Decimal::parse(row["requested_amount"].as<std::string>());
    order.filledAmount = domain::Decimal::parse(row["filled_amount"].as<std::string>());
    order.averageFillPrice = domain::Decimal::parse(row["average_fill_price"].as<std::string>());
    order.fees = domain::Decimal::parse(row["fees"].as<std::string>());
    order.status = domain::orderStatusFromString(row["status"].as<std::string>());
    if (!row["deal_id"].is_null()) {
        order.dealId = row["deal_id"].as<int64_t>();
    }
    order.createdAt = domain::Timestamp::fromMillis(row["created_at_ms"].as<int64_t>());
    order.lastUpdatedAt = domain::Timestamp::fromMillis(row["updated_at_ms"].as<int64_t>());
    order.retryCount = row["retry_count"].as<int32_t>();
    if (!row["last_error"].is_null()) {
        order.lastError = row["last_error"].as<std::string>();
    }
    return order;
}

} // namespace memtrade::adapters::secondary
