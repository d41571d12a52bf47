#include "domain/Decimal.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace memtrade::domain {

namespace {

using Wide = __int128;

constexpr Wide NANO = 1000000000;

Wide pow10(int digits) {
    Wide result = 1;
    for (int i = 0; i < digits; ++i) {
        result *= 10;
    }
    return result;
}

// Деление с округлением к -inf
Wide floorDiv(Wide a, Wide b) {
    Wide q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

Wide absWide(Wide value) {
    return value < 0 ? -value : value;
}

// Произведение в Wide; |a|, |b| не больше toNanos() любого Decimal
Wide checkedMul(Wide a, Wide b) {
    constexpr Wide WIDE_MAX = static_cast<Wide>(~static_cast<unsigned __int128>(0) >> 1);
    if (a != 0 && absWide(b) > WIDE_MAX / absWide(a)) {
        throw std::overflow_error("Decimal overflow");
    }
    return a * b;
}

} // namespace

Decimal::Decimal(int64_t units, int32_t nano) {
    *this = fromNanos(static_cast<Wide>(units) * NANO + nano);
}

Decimal::Wide Decimal::toNanos() const {
    return static_cast<Wide>(units_) * NANO + nano_;
}

Decimal Decimal::fromNanos(Wide nanos) {
    Wide units = floorDiv(nanos, NANO);
    if (units > std::numeric_limits<int64_t>::max() ||
        units < std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error("Decimal overflow");
    }
    Decimal result;
    result.units_ = static_cast<int64_t>(units);
    result.nano_ = static_cast<int32_t>(nanos - units * NANO);
    return result;
}

Decimal Decimal::parse(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Decimal: empty string");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }

    Wide integral = 0;
    Wide fraction = 0;
    int fractionDigits = 0;
    bool seenDigit = false;
    bool seenPoint = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seenPoint) {
                throw std::invalid_argument("Decimal: malformed number '" + text + "'");
            }
            seenPoint = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Decimal: malformed number '" + text + "'");
        }
        seenDigit = true;
        if (!seenPoint) {
            integral = integral * 10 + (c - '0');
            if (integral > std::numeric_limits<int64_t>::max()) {
                throw std::overflow_error("Decimal overflow: '" + text + "'");
            }
        } else if (fractionDigits < MAX_SCALE) {
            fraction = fraction * 10 + (c - '0');
            ++fractionDigits;
        }
    }

    if (!seenDigit) {
        throw std::invalid_argument("Decimal: malformed number '" + text + "'");
    }

    Wide nanos = integral * NANO + fraction * pow10(MAX_SCALE - fractionDigits);
    return fromNanos(negative ? -nanos : nanos);
}

Decimal Decimal::fromDouble(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Decimal: non-finite value");
    }
    long double scaled = static_cast<long double>(value) * 1e9L;
    return fromNanos(static_cast<Wide>(std::llround(scaled)));
}

double Decimal::toDouble() const {
    return static_cast<double>(units_) + static_cast<double>(nano_) / NANO_SCALE;
}

std::string Decimal::toString() const {
    Wide nanos = toNanos();
    bool negative = nanos < 0;
    if (negative) {
        nanos = -nanos;
    }

    Wide integral = nanos / NANO;
    Wide fraction = nanos % NANO;

    std::string digits;
    if (integral == 0) {
        digits = "0";
    }
    while (integral > 0) {
        digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(integral % 10)));
        integral /= 10;
    }

    std::string result = negative ? "-" + digits : digits;
    if (fraction != 0) {
        std::string frac(MAX_SCALE, '0');
        for (int i = MAX_SCALE - 1; i >= 0; --i) {
            frac[i] = static_cast<char>('0' + static_cast<int>(fraction % 10));
            fraction /= 10;
        }
        while (!frac.empty() && frac.back() == '0') {
            frac.pop_back();
        }
        result += "." + frac;
    }
    return result;
}

Decimal Decimal::floorToScale(int digits) const {
    if (digits >= MAX_SCALE) {
        return *this;
    }
    if (digits < 0) {
        digits = 0;
    }
    Wide step = pow10(MAX_SCALE - digits);
    return fromNanos(floorDiv(toNanos(), step) * step);
}

Decimal Decimal::ceilToScale(int digits) const {
    if (digits >= MAX_SCALE) {
        return *this;
    }
    if (digits < 0) {
        digits = 0;
    }
    Wide step = pow10(MAX_SCALE - digits);
    return fromNanos(-floorDiv(-toNanos(), step) * step);
}

int Decimal::scale() const {
    if (nano_ == 0) {
        return 0;
    }
    int digits = MAX_SCALE;
    int32_t n = nano_;
    while (n % 10 == 0) {
        n /= 10;
        --digits;
    }
    return digits;
}

Decimal Decimal::operator+(const Decimal& other) const {
    return fromNanos(toNanos() + other.toNanos());
}

Decimal Decimal::operator-(const Decimal& other) const {
    return fromNanos(toNanos() - other.toNanos());
}

Decimal Decimal::operator-() const {
    return fromNanos(-toNanos());
}

Decimal Decimal::operator*(const Decimal& other) const {
    return fromNanos(checkedMul(toNanos(), other.toNanos()) / NANO);
}

Decimal Decimal::operator/(const Decimal& other) const {
    if (other.isZero()) {
        throw std::domain_error("Decimal: division by zero");
    }
    return fromNanos(checkedMul(toNanos(), NANO) / other.toNanos());
}

} // namespace memtrade::domain
