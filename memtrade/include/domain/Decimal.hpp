#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace memtrade::domain {

/**
 * @brief Десятичное число с фиксированной точкой (10^-9)
 *
 * Хранит целую часть и дробную часть в нано-единицах, как денежные значения
 * брокерских API. Вся арифметика выполняется в целых числах (128-битные
 * промежуточные значения), поэтому повторные обновления цены и объёма
 * не накапливают ошибку округления.
 *
 * Инвариант: 0 <= nano < 10^9, units: целая часть, округлённая вниз.
 * Например, -1.25 хранится как units = -2, nano = 750000000.
 */
class Decimal {
public:
    static constexpr int32_t NANO_SCALE = 1000000000;
    static constexpr int MAX_SCALE = 9;

    Decimal() = default;

    Decimal(int64_t units, int32_t nano);

    static Decimal fromInt(int64_t value) { return Decimal(value, 0); }

    /**
     * @brief Разобрать строку вида "-123.456"
     * @details Знаки после 9-го разряда отбрасываются.
     * @throws std::invalid_argument если строка не является числом
     */
    static Decimal parse(const std::string& text);

    /**
     * @brief Создать из double (только для значений конфигурации)
     */
    static Decimal fromDouble(double value);

    int64_t units() const { return units_; }
    int32_t nano() const { return nano_; }

    /// Только для отображения и логов
    double toDouble() const;

    /// Минимальная десятичная запись: "2", "1.5", "-0.001"
    std::string toString() const;

    bool isZero() const { return units_ == 0 && nano_ == 0; }
    bool isNegative() const { return units_ < 0; }
    bool isPositive() const { return !isZero() && !isNegative(); }

    Decimal abs() const { return isNegative() ? -*this : *this; }

    /**
     * @brief Округлить вниз (к -inf) до заданного числа знаков после точки
     */
    Decimal floorToScale(int digits) const;

    /**
     * @brief Округлить вверх (к +inf) до заданного числа знаков после точки
     */
    Decimal ceilToScale(int digits) const;

    /**
     * @brief Количество значащих знаков после точки (0..9)
     */
    int scale() const;

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator-() const;

    /// Результат усекается к нулю до 10^-9
    Decimal operator*(const Decimal& other) const;

    /**
     * @throws std::domain_error при делении на ноль
     */
    Decimal operator/(const Decimal& other) const;

    Decimal& operator+=(const Decimal& other) { return *this = *this + other; }
    Decimal& operator-=(const Decimal& other) { return *this = *this - other; }

    bool operator==(const Decimal& other) const { return units_ == other.units_ && nano_ == other.nano_; }
    bool operator!=(const Decimal& other) const { return !(*this == other); }
    bool operator<(const Decimal& other) const {
        return units_ < other.units_ || (units_ == other.units_ && nano_ < other.nano_);
    }
    bool operator>(const Decimal& other) const { return other < *this; }
    bool operator<=(const Decimal& other) const { return !(other < *this); }
    bool operator>=(const Decimal& other) const { return !(*this < other); }

private:
    using Wide = __int128;

    Wide toNanos() const;
    static Decimal fromNanos(Wide nanos);

    int64_t units_ = 0;
    int32_t nano_ = 0;
};

inline Decimal min(const Decimal& a, const Decimal& b) { return b < a ? b : a; }
inline Decimal max(const Decimal& a, const Decimal& b) { return a < b ? b : a; }

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

} // namespace memtrade::domain
