#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace memtrade::domain {

/**
 * @brief Временная метка с точностью до миллисекунды
 *
 * Для хранения и сравнения используется целое число миллисекунд с эпохи
 * (toMillis/fromMillis); строковое ISO 8601 представление используется только в логах.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::milliseconds(millis)));
    }

    int64_t toMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()).count();
    }

    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()).count();
    }

    /**
     * @brief Разобрать строку формата "2025-12-16T10:30:00Z" (UTC)
     * @throws std::invalid_argument если формат не распознан
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + isoString);
        }

        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    /**
     * @brief ISO 8601 в UTC с миллисекундами: "2025-12-16T10:30:00.123Z"
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        auto millis = toMillis() % 1000;
        if (millis < 0) {
            millis += 1000;
        }

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return ss.str();
    }

    /**
     * @brief Компактный формат для имён файлов: "20251216_103000"
     */
    std::string toFileStamp() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y%m%d_%H%M%S");
        return ss.str();
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp addMinutes(int64_t minutes) const {
        return Timestamp(value + std::chrono::minutes(minutes));
    }

    Timestamp addDays(int64_t days) const {
        return Timestamp(value + std::chrono::hours(24 * days));
    }

    /// Интервал между метками
    std::chrono::milliseconds operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value - other.value);
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace memtrade::domain
