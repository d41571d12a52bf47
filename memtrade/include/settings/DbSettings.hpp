#pragma once

#include "SettingsUtils.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace memtrade::settings {

/**
 * @brief Настройки подключения к PostgreSQL
 *
 * Значения из секции "database" config.json; переменные окружения
 * MEMTRADE_DB_* имеют приоритет.
 */
class DbSettings {
public:
    DbSettings() : DbSettings(nlohmann::json::object()) {}

    explicit DbSettings(const nlohmann::json& section) {
        host_ = getEnvOrDefault("MEMTRADE_DB_HOST", valueOr<std::string>(section, "host", "localhost"));
        port_ = std::stoi(getEnvOrDefault("MEMTRADE_DB_PORT",
                                          std::to_string(valueOr<int>(section, "port", 5432))));
        name_ = getEnvOrDefault("MEMTRADE_DB_NAME", valueOr<std::string>(section, "name", "memtrade"));
        user_ = getEnvOrDefault("MEMTRADE_DB_USER", valueOr<std::string>(section, "user", "memtrade"));
        password_ = getEnvOrDefault("MEMTRADE_DB_PASSWORD", valueOr<std::string>(section, "password", ""));
        connectTimeoutSeconds_ = valueOr<int>(section, "connect_timeout_seconds", 5);
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    int getConnectTimeoutSeconds() const { return connectTimeoutSeconds_; }

    std::string getConnectionString() const {
        std::string result = "host=" + host_ + " port=" + std::to_string(port_) +
                             " dbname=" + name_ + " user=" + user_ +
                             " connect_timeout=" + std::to_string(connectTimeoutSeconds_);
        if (!password_.empty()) {
            result += " password=" + password_;
        }
        return result;
    }

private:
    std::string host_;
    int port_ = 5432;
    std::string name_;
    std::string user_;
    std::string password_;
    int connectTimeoutSeconds_ = 5;
};

} // namespace memtrade::settings
