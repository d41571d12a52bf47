#pragma once

#include "domain/Decimal.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace memtrade::settings {

inline std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

/**
 * @brief Значение ключа секции или значение по умолчанию
 * @throws std::invalid_argument если тип значения не подходит
 */
template <typename T>
T valueOr(const nlohmann::json& section, const char* key, const T& defaultValue) {
    if (!section.is_object() || !section.contains(key) || section.at(key).is_null()) {
        return defaultValue;
    }
    try {
        return section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid config value '") + key + "': " + e.what());
    }
}

/**
 * @brief Десятичное значение: число или строка ("0.1")
 */
inline domain::Decimal decimalOr(const nlohmann::json& section, const char* key,
                                 const domain::Decimal& defaultValue) {
    if (!section.is_object() || !section.contains(key) || section.at(key).is_null()) {
        return defaultValue;
    }
    const auto& value = section.at(key);
    if (value.is_string()) {
        return domain::Decimal::parse(value.get<std::string>());
    }
    if (value.is_number()) {
        return domain::Decimal::fromDouble(value.get<double>());
    }
    throw std::invalid_argument(std::string("Invalid decimal config value '") + key + "'");
}

inline const nlohmann::json& sectionOf(const nlohmann::json& root, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (root.is_object() && root.contains(name) && root.at(name).is_object()) {
        return root.at(name);
    }
    return empty;
}

} // namespace memtrade::settings
