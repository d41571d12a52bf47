/**
 * @file DecimalTest.cpp
 * @brief Unit-тесты для Decimal
 */

#include <gtest/gtest.h>

#include "domain/Decimal.hpp"

#include <sstream>
#include <stdexcept>

using memtrade::domain::Decimal;

TEST(DecimalTest, Parse_KeepsExactValue) {
    auto value = Decimal::parse("123.456");

    EXPECT_EQ(value.units(), 123);
    EXPECT_EQ(value.nano(), 456000000);
    EXPECT_EQ(value.toString(), "123.456");
}

TEST(DecimalTest, Parse_NegativeNormalizesNano) {
    auto value = Decimal::parse("-1.25");

    EXPECT_EQ(value.units(), -2);
    EXPECT_EQ(value.nano(), 750000000);
    EXPECT_EQ(value.toString(), "-1.25");
    EXPECT_TRUE(value.isNegative());
}

TEST(DecimalTest, Parse_DropsDigitsBeyondNano) {
    EXPECT_EQ(Decimal::parse("0.1234567899").toString(), "0.123456789");
}

TEST(DecimalTest, Parse_RejectsGarbage) {
    EXPECT_THROW(Decimal::parse(""), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("abc"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("-"), std::invalid_argument);
}

TEST(DecimalTest, Addition_HasNoBinaryRoundingError) {
    auto sum = Decimal::parse("0.1") + Decimal::parse("0.2");

    EXPECT_EQ(sum, Decimal::parse("0.3"));
}

TEST(DecimalTest, RepeatedUpdates_DoNotAccumulateDrift) {
    Decimal total;
    for (int i = 0; i < 1000; ++i) {
        total += Decimal::parse("0.001");
    }
    EXPECT_EQ(total, Decimal::fromInt(1));
}

TEST(DecimalTest, MultiplyAndDivide) {
    EXPECT_EQ(Decimal::parse("1.5") * Decimal::parse("2.5"), Decimal::parse("3.75"));
    EXPECT_EQ(Decimal::fromInt(10) / Decimal::fromInt(4), Decimal::parse("2.5"));
    EXPECT_EQ((Decimal::fromInt(10) / Decimal::fromInt(3)).toString(), "3.333333333");
}

TEST(DecimalTest, DivisionByZero_Throws) {
    EXPECT_THROW(Decimal::fromInt(1) / Decimal(), std::domain_error);
}

TEST(DecimalTest, MultiplyAndDivide_OverflowThrows) {
    const Decimal huge = Decimal::fromInt(100000000000LL);

    EXPECT_THROW(huge * huge, std::overflow_error);
    EXPECT_THROW(-huge * huge, std::overflow_error);
    EXPECT_THROW(huge / Decimal::parse("0.000000001"), std::overflow_error);
    EXPECT_EQ(Decimal::fromInt(100000) * Decimal::fromInt(100000), Decimal::fromInt(10000000000LL));
}

TEST(DecimalTest, FloorAndCeilToScale) {
    auto value = Decimal::parse("1.239");

    EXPECT_EQ(value.floorToScale(2), Decimal::parse("1.23"));
    EXPECT_EQ(value.ceilToScale(2), Decimal::parse("1.24"));
    EXPECT_EQ(Decimal::parse("-1.231").floorToScale(2), Decimal::parse("-1.24"));
    EXPECT_EQ(Decimal::parse("1.5").floorToScale(0), Decimal::fromInt(1));
}

TEST(DecimalTest, Scale_CountsSignificantFractionDigits) {
    EXPECT_EQ(Decimal::fromInt(7).scale(), 0);
    EXPECT_EQ(Decimal::parse("1.2300").scale(), 2);
    EXPECT_EQ(Decimal::parse("0.00001").scale(), 5);
}

TEST(DecimalTest, SignPredicates) {
    EXPECT_TRUE(Decimal().isZero());
    EXPECT_FALSE(Decimal().isPositive());
    EXPECT_TRUE(Decimal::parse("0.000000001").isPositive());
    EXPECT_EQ(Decimal::parse("-3.5").abs(), Decimal::parse("3.5"));
}

TEST(DecimalTest, Comparison_AndMinMax) {
    auto a = Decimal::parse("1.99");
    auto b = Decimal::parse("2");

    EXPECT_LT(a, b);
    EXPECT_GT(b, a);
    EXPECT_EQ(memtrade::domain::min(a, b), a);
    EXPECT_EQ(memtrade::domain::max(a, b), b);
}

TEST(DecimalTest, FromDouble_ForConfigValues) {
    EXPECT_EQ(Decimal::fromDouble(0.1), Decimal::parse("0.1"));
    EXPECT_EQ(Decimal::fromDouble(3.0), Decimal::fromInt(3));
}

TEST(DecimalTest, StreamsAsPlainString) {
    std::ostringstream out;
    out << Decimal::parse("65000.50");
    EXPECT_EQ(out.str(), "65000.5");
}
