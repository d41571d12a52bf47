#pragma once

#include "DbSettings.hpp"
#include "MonitorSettings.hpp"
#include "StorageSettings.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace memtrade::settings {

/**
 * @brief Полная конфигурация движка
 *
 * @example config.json
 * ```json
 * {
 *   "database": { "host": "localhost", "port": 5432, "name": "memtrade" },
 *   "storage": {
 *     "orders_backend": "memory_with_durable_sync",
 *     "deals_backend": "pure_memory_legacy",
 *     "dump_dir": "data/dumps",
 *     "tickers": { "memory_limit_bytes": 268435456, "dump_threshold_bytes": 201326592 }
 *   },
 *   "stale_order_monitor": { "max_age_minutes": 15, "price_offset_percent": "0.1" }
 * }
 * ```
 */
class EngineSettings {
public:
    EngineSettings() : EngineSettings(nlohmann::json::object()) {}

    /**
     * @throws std::invalid_argument при некорректных значениях
     */
    explicit EngineSettings(const nlohmann::json& root)
        : db_(sectionOf(root, "database"))
        , storage_(sectionOf(root, "storage"))
        , monitor_(sectionOf(root, "stale_order_monitor"))
    {}

    /**
     * @brief Загрузить config.json
     * @throws std::runtime_error если файл не читается или содержит не JSON
     */
    static EngineSettings load(const std::string& path);

    /**
     * @brief Путь к конфигу: MEMTRADE_CONFIG, затем argv[1], затем config/config.json
     */
    static std::string resolveConfigPath(int argc, char* argv[]);

    const DbSettings& db() const { return db_; }
    const StorageSettings& storage() const { return storage_; }
    const MonitorSettings& monitor() const { return monitor_; }

private:
    DbSettings db_;
    StorageSettings storage_;
    MonitorSettings monitor_;
};

} // namespace memtrade::settings
