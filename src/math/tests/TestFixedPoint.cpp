/**
 * @file TestFixedPoint.cpp
 * @brief Unit tests for math::FixedPoint representation, comparison,
 *        additive operators, and conversions.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>

#include "FixedPointStringMaker.hpp"

namespace lockstep::math {

using Catch::Matchers::WithinAbs;
using core::i64;

TEST_CASE("FixedPoint sentinel and limit encodings", "[math][fixedpoint]")
{
    STATIC_REQUIRE(FixedPoint::nan().raw()              == std::numeric_limits<i64>::min());
    STATIC_REQUIRE(FixedPoint::negativeInfinity().raw() == std::numeric_limits<i64>::min() + 1);
    STATIC_REQUIRE(FixedPoint::positiveInfinity().raw() == std::numeric_limits<i64>::max());
    STATIC_REQUIRE(FixedPoint::maxValue().raw()         == std::numeric_limits<i64>::max() - 1);
    STATIC_REQUIRE(FixedPoint::minValue().raw()         == std::numeric_limits<i64>::min() + 2);

    REQUIRE(FixedPoint::nan().isNaN());
    REQUIRE(FixedPoint::positiveInfinity().isInfinity());
    REQUIRE(FixedPoint::negativeInfinity().isInfinity());
    REQUIRE(FixedPoint::maxValue().isFinite());
    REQUIRE(FixedPoint::minValue().isFinite());
    REQUIRE_FALSE(FixedPoint::nan().isFinite());
}

TEST_CASE("FixedPoint named constants", "[math][fixedpoint]")
{
    STATIC_REQUIRE(FixedPoint::zero().raw()      == 0);
    STATIC_REQUIRE(FixedPoint::one().raw()       == (i64{1} << 32));
    STATIC_REQUIRE(FixedPoint::half().raw()      == (i64{1} << 31));
    STATIC_REQUIRE(FixedPoint::precision().raw() == 1);

    SECTION("pi, rad2Deg and deg2Rad derive from their literals")
    {
        STATIC_REQUIRE(FixedPoint::pi().raw()      == 13493037474);
        STATIC_REQUIRE(FixedPoint::rad2Deg().raw() == 246083502080);
        STATIC_REQUIRE(FixedPoint::deg2Rad().raw() == 74947176);
    }

    SECTION("default construction is zero")
    {
        constexpr FixedPoint value;
        STATIC_REQUIRE(value.raw() == 0);
    }
}

TEST_CASE("FixedPoint fromRaw round-trips any bit pattern", "[math][fixedpoint]")
{
    for (i64 raw : {i64{0}, i64{1}, i64{-1}, i64{123456789012345}, std::numeric_limits<i64>::min(),
                    std::numeric_limits<i64>::max(), FixedPoint::kMaxRaw + 1})
    {
        REQUIRE(FixedPoint::fromRaw(raw).raw() == raw);
    }
}

TEST_CASE("FixedPoint implicit conversion from native values", "[math][fixedpoint]")
{
    SECTION("integers scale by 2^32")
    {
        const FixedPoint five = 5;
        REQUIRE(five.raw() == 5 * FixedPoint::kOne);
        REQUIRE(FixedPoint(-3).raw() == -3 * FixedPoint::kOne);
        REQUIRE(FixedPoint::fromInt(std::numeric_limits<core::i32>::max()).raw()
                == i64{std::numeric_limits<core::i32>::max()} * FixedPoint::kOne);
    }

    SECTION("INT32_MIN saturates instead of aliasing NaN")
    {
        const FixedPoint lowest = std::numeric_limits<core::i32>::min();
        REQUIRE_FALSE(lowest.isNaN());
        REQUIRE(lowest.raw() == FixedPoint::kMinRaw);
    }

    SECTION("doubles and floats truncate toward zero")
    {
        const FixedPoint half = 0.5;
        REQUIRE(half.raw() == FixedPoint::half().raw());
        REQUIRE(FixedPoint(0.5f).raw() == FixedPoint::half().raw());
        REQUIRE(FixedPoint(-2.75).raw() == -11811160064);
        REQUIRE(FixedPoint(2.4).raw() == 10307921510);
        REQUIRE(FixedPoint(std::ldexp(1.0, -33)).raw() == 0);
        REQUIRE(FixedPoint(-1.5 * std::ldexp(1.0, -32)).raw() == -1);
    }

    SECTION("non-finite and out-of-range doubles")
    {
        REQUIRE(FixedPoint(std::numeric_limits<double>::quiet_NaN()).isNaN());
        REQUIRE(FixedPoint(std::numeric_limits<double>::infinity()).isPositiveInfinity());
        REQUIRE(FixedPoint(-std::numeric_limits<double>::infinity()).isNegativeInfinity());
        REQUIRE(FixedPoint(1e20).raw() == FixedPoint::kMaxRaw);
        REQUIRE(FixedPoint(-1e20).raw() == FixedPoint::kMinRaw);
    }
}

TEST_CASE("FixedPoint relational operators", "[math][fixedpoint]")
{
    const FixedPoint nan = FixedPoint::nan();
    const FixedPoint one = FixedPoint::one();

    SECTION("NaN is unordered and unequal to everything")
    {
        REQUIRE_FALSE(nan == nan);
        REQUIRE(nan != nan);
        REQUIRE_FALSE(nan < one);
        REQUIRE_FALSE(nan > one);
        REQUIRE_FALSE(nan <= one);
        REQUIRE_FALSE(nan >= one);
        REQUIRE_FALSE(one < nan);
        REQUIRE_FALSE(one >= nan);
        REQUIRE_FALSE(nan < FixedPoint::negativeInfinity());
        REQUIRE_FALSE(nan <= nan);
    }

    SECTION("non-NaN values are reflexive")
    {
        for (FixedPoint x : {FixedPoint::zero(), one, FixedPoint::maxValue(),
                             FixedPoint::positiveInfinity(), FixedPoint::negativeInfinity()})
        {
            REQUIRE(x == x);
            REQUIRE_FALSE(x != x);
            REQUIRE(x <= x);
            REQUIRE(x >= x);
        }
    }

    SECTION("infinities bracket every finite value")
    {
        REQUIRE(FixedPoint::negativeInfinity() < FixedPoint::minValue());
        REQUIRE(FixedPoint::minValue() < FixedPoint::zero());
        REQUIRE(FixedPoint::zero() < FixedPoint::maxValue());
        REQUIRE(FixedPoint::maxValue() < FixedPoint::positiveInfinity());
        REQUIRE(FixedPoint::negativeInfinity() < FixedPoint::positiveInfinity());
    }

    SECTION("mixed with native operands")
    {
        REQUIRE(FixedPoint(2.5) > 2);
        REQUIRE(3 > FixedPoint(2.5));
        REQUIRE(FixedPoint(4) == 4);
    }
}

TEST_CASE("FixedPoint addition and subtraction", "[math][fixedpoint]")
{
    const FixedPoint pinf = FixedPoint::positiveInfinity();
    const FixedPoint ninf = FixedPoint::negativeInfinity();

    SECTION("finite operands add their raw values")
    {
        const FixedPoint a = 3.25;
        const FixedPoint b = -7.5;
        REQUIRE(a + b == FixedPoint::fromRaw(a.raw() + b.raw()));
        REQUIRE(a - b == FixedPoint::fromRaw(a.raw() - b.raw()));
        REQUIRE(a + b == FixedPoint(-4.25));
        REQUIRE(a - b == FixedPoint(10.75));
    }

    SECTION("finite overflow wraps silently")
    {
        const FixedPoint wrapped = FixedPoint::maxValue() + FixedPoint::one();
        REQUIRE(wrapped.raw() == std::numeric_limits<i64>::min() + FixedPoint::kOne - 2);
    }

    SECTION("NaN propagates")
    {
        REQUIRE((FixedPoint::nan() + 1).isNaN());
        REQUIRE((1 - FixedPoint::nan()).isNaN());
        REQUIRE((pinf + FixedPoint::nan()).isNaN());
    }

    SECTION("infinity addition table")
    {
        REQUIRE((pinf + ninf).isNaN());
        REQUIRE((ninf + pinf).isNaN());
        REQUIRE((pinf + pinf).isPositiveInfinity());
        REQUIRE((ninf + ninf).isNegativeInfinity());
        REQUIRE((pinf + 42).isPositiveInfinity());
        REQUIRE((42 + pinf).isPositiveInfinity());
        REQUIRE((FixedPoint(-3) + ninf).isNegativeInfinity());
    }

    SECTION("infinity subtraction table")
    {
        REQUIRE((pinf - pinf).isNaN());
        REQUIRE((ninf - ninf).isNaN());
        REQUIRE((pinf - ninf).isPositiveInfinity());
        REQUIRE((ninf - pinf).isNegativeInfinity());
        REQUIRE((pinf - 5).isPositiveInfinity());
        REQUIRE((5 - pinf).isNegativeInfinity());
        REQUIRE((5 - ninf).isPositiveInfinity());
    }

    SECTION("compound assignment rebinds to the new value")
    {
        FixedPoint x = 1;
        x += 2;
        x -= 0.5;
        REQUIRE(x == FixedPoint(2.5));
    }
}

TEST_CASE("FixedPoint negation", "[math][fixedpoint]")
{
    REQUIRE(-FixedPoint(2.5) == FixedPoint(-2.5));
    REQUIRE((-FixedPoint::nan()).isNaN());
    REQUIRE((-FixedPoint::positiveInfinity()).isNegativeInfinity());
    REQUIRE((-FixedPoint::negativeInfinity()).isPositiveInfinity());
    REQUIRE(-FixedPoint::maxValue() == FixedPoint::minValue());
    REQUIRE(-FixedPoint::minValue() == FixedPoint::maxValue());
}

TEST_CASE("FixedPoint modulo", "[math][fixedpoint]")
{
    SECTION("sign follows the dividend")
    {
        REQUIRE(FixedPoint(10) % 3 == 1);
        REQUIRE(FixedPoint(-10) % 3 == -1);
        REQUIRE(FixedPoint(10) % -3 == 1);
        REQUIRE(FixedPoint(5.5) % 2 == FixedPoint(1.5));
    }

    SECTION("special operands")
    {
        REQUIRE((FixedPoint::nan() % 1).isNaN());
        REQUIRE((FixedPoint(1) % FixedPoint::nan()).isNaN());
        REQUIRE((FixedPoint(7) % 0).isNaN());
        REQUIRE((FixedPoint::positiveInfinity() % 3).isNaN());
        REQUIRE(FixedPoint(3) % FixedPoint::negativeInfinity() == 3);
    }
}

TEST_CASE("FixedPoint::toInt truncates toward zero", "[math][fixedpoint]")
{
    REQUIRE(FixedPoint(5).toInt().value() == 5);
    REQUIRE(FixedPoint(2.9).toInt().value() == 2);
    REQUIRE(FixedPoint(-2.9).toInt().value() == -2);
    REQUIRE(FixedPoint::positiveInfinity().toInt().value() == std::numeric_limits<core::i32>::max());

    const auto nan = FixedPoint::nan().toInt();
    REQUIRE_FALSE(nan.has_value());
    REQUIRE(nan.error().code() == core::ErrorCode::InvalidArgument);
}

TEST_CASE("FixedPoint::roundToInt rounds halves away from zero", "[math][fixedpoint]")
{
    REQUIRE(FixedPoint(2.5).roundToInt().value() == 3);
    REQUIRE(FixedPoint(-2.5).roundToInt().value() == -3);
    REQUIRE(FixedPoint(2.4).roundToInt().value() == 2);
    REQUIRE(FixedPoint(-2.4).roundToInt().value() == -2);
    REQUIRE(FixedPoint(-2.6).roundToInt().value() == -3);
    REQUIRE(FixedPoint(-3).roundToInt().value() == -3);
    REQUIRE(FixedPoint::zero().roundToInt().value() == 0);

    SECTION("NaN is rejected")
    {
        const auto r = FixedPoint::nan().roundToInt();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == core::ErrorCode::InvalidArgument);
    }

    SECTION("results outside i32 are rejected")
    {
        const auto r = FixedPoint::maxValue().roundToInt();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == core::ErrorCode::OutOfRange);
    }
}

TEST_CASE("FixedPoint floating-point views", "[math][fixedpoint]")
{
    REQUIRE(FixedPoint(2.5).toDouble() == 2.5);
    REQUIRE(FixedPoint(-0.25).toFloat() == -0.25f);
    REQUIRE_THAT(FixedPoint::pi().toDouble(), WithinAbs(3.1415926, 1e-9));
    REQUIRE(std::isnan(FixedPoint::nan().toDouble()));
    REQUIRE(std::isnan(FixedPoint::nan().toFloat()));
    REQUIRE(FixedPoint::positiveInfinity().toDouble() == std::numeric_limits<double>::infinity());
    REQUIRE(FixedPoint::negativeInfinity().toFloat() == -std::numeric_limits<float>::infinity());
}

TEST_CASE("FixedPoint byte channel is little-endian", "[math][fixedpoint]")
{
    const auto value = FixedPoint::fromRaw(0x0102030405060708);
    const auto bytes = value.toBytes();

    REQUIRE(bytes[0] == core::byte{0x08});
    REQUIRE(bytes[3] == core::byte{0x05});
    REQUIRE(bytes[7] == core::byte{0x01});
    REQUIRE(FixedPoint::fromBytes(bytes).raw() == value.raw());

    SECTION("sentinels survive the channel bit-for-bit")
    {
        REQUIRE(FixedPoint::fromBytes(FixedPoint::nan().toBytes()).isNaN());
        REQUIRE(FixedPoint::fromBytes(FixedPoint::negativeInfinity().toBytes()).isNegativeInfinity());
        REQUIRE(FixedPoint::fromBytes(FixedPoint(-1).toBytes()).raw() == -FixedPoint::kOne);
    }
}

TEST_CASE("FixedPoint::toString", "[math][fixedpoint]")
{
    REQUIRE(FixedPoint(2.5).toString() == "2.5");
    REQUIRE(FixedPoint(-0.25).toString() == "-0.25");
    REQUIRE(FixedPoint::zero().toString() == "0");
    REQUIRE(FixedPoint::nan().toString() == "NaN");
    REQUIRE(FixedPoint::positiveInfinity().toString() == "+Inf");
    REQUIRE(FixedPoint::negativeInfinity().toString() == "-Inf");
}

} // namespace lockstep::math
