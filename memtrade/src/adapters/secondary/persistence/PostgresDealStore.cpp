#include "adapters/secondary/persistence/PostgresDealStore.hpp"

#include <iostream>

namespace memtrade::adapters::secondary {

void PostgresDealStore::ensureSchema() {
    db_.inTransaction([](pqxx::work& txn) {
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS deals (
                id                    BIGINT PRIMARY KEY,
                symbol                TEXT NOT NULL,
                status                TEXT NOT NULL,
                buy_order_id          BIGINT,
                sell_order_id         BIGINT,
                target_profit_percent NUMERIC(38, 9) NOT NULL,
                realized_profit       NUMERIC(38, 9) NOT NULL,
                created_at_ms         BIGINT NOT NULL,
                completed_at_ms       BIGINT,
                last_error            TEXT
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_deals_status ON deals (status)");
    });
}

void PostgresDealStore::upsert(const domain::Deal& deal) {
    db_.inTransaction([&deal](pqxx::work& txn) { upsertIn(txn, deal); });
}

void PostgresDealStore::remove(int64_t id) {
    db_.inTransaction([id](pqxx::work& txn) {
        txn.exec_params("DELETE FROM deals WHERE id = $1", id);
    });
}

void PostgresDealStore::replaceAll(const std::vector<domain::Deal>& deals) {
    db_.inTransaction([&deals](pqxx::work& txn) {
        txn.exec("DELETE FROM deals");
        for (const auto& deal : deals) {
            upsertIn(txn, deal);
        }
    });
    std::cout << "[PostgresDealStore] Replaced table with " << deals.size() << " deals" << std::endl;
}

std::vector<domain::Deal> PostgresDealStore::loadAll() {
    std::vector<domain::Deal> deals;

    db_.inTransaction([&deals](pqxx::work& txn) {
        auto result = txn.exec(R"(
            SELECT id, symbol, status, buy_order_id, sell_order_id,
                   target_profit_percent::text AS target_profit_percent,
                   realized_profit::text AS realized_profit,
                   created_at_ms, completed_at_ms, last_error
            FROM deals
            ORDER BY id
        )");

        deals.reserve(result.size());
        for (const auto& row : result) {
            deals.push_back(rowToDeal(row));
        }
    });

    return deals;
}

void PostgresDealStore::upsertIn(pqxx::work& txn, const domain::Deal& deal) {
    std::optional<int64_t> completedAtMs;
    if (deal.completedAt) {
        completedAtMs = deal.completedAt->toMillis();
    }

    txn.exec_params(
        R"(
            INSERT INTO deals (
                id, symbol, status, buy_order_id, sell_order_id,
                target_profit_percent, realized_profit,
                created_at_ms, completed_at_ms, last_error
            )
            VALUES ($1, $2, $3, $4, $5, $6::numeric, $7::numeric, $8, $9, $10)
            ON CONFLICT (id) DO UPDATE SET
                status = EXCLUDED.status,
                buy_order_id = EXCLUDED.buy_order_id,
                sell_order_id = EXCLUDED.sell_order_id,
                target_profit_percent = EXCLUDED.target_profit_percent,
                realized_profit = EXCLUDED.realized_profit,
                completed_at_ms = EXCLUDED.completed_at_ms,
                last_error = EXCLUDED.last_error
        )",
        deal.id,
        deal.symbol,
        domain::toString(deal.status),
        deal.buyOrderId,
        deal.sellOrderId,
        deal.targetProfitPercent.toString(),
        deal.realizedProfit.toString(),
        deal.createdAt.toMillis(),
        completedAtMs,
        deal.lastError.empty() ? std::optional<std::string>() : std::optional<std::string>(deal.lastError)
    );
}

domain::Deal PostgresDealStore::rowToDeal(const pqxx::row& row) {
    domain::Deal deal;
    deal.id = row["id"].as<int64_t>();
    deal.symbol = row["symbol"].as<std::string>();
    deal.status = domain::dealStatusFromString(row["status"].as<std::string>());
    if (!row["buy_order_id"].is_null()) {
        deal.buyOrderId = row["buy_order_id"].as<int64_t>();
    }
    if (!row["sell_order_id"].is_null()) {
        deal.sellOrderId = row["sell_order_id"].as<int64_t>();
    }
    deal.targetProfitPercent = domain::Decimal::parse(row["target_profit_percent"].as<std::string>());
    deal.realizedProfit = domain::Decimal::parse(row["realized_profit"].as<std::string>());
    deal.createdAt = domain::Timestamp::fromMillis(row["created_at_ms"].as<int64_t>());
    if (!row["completed_at_ms"].is_null()) {
        deal.completedAt = domain::Timestamp::fromMillis(row["completed_at_ms"].as<int64_t>());
    }
    if (!row["last_error"].is_null()) {
        deal.lastError = row["last_error"].as<std::string>();
    }
    return deal;
}

} // namespace memtrade::adapters::secondary
