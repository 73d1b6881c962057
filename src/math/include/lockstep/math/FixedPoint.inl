/**
 * @file FixedPoint.inl
 * @brief Inline implementation of FixedPoint arithmetic operations.
 * @see   FixedPoint.hpp
 */

#ifndef LOCKSTEP_MATH_FIXED_POINT_INL
    #define LOCKSTEP_MATH_FIXED_POINT_INL

namespace lockstep::math {

namespace detail {

inline constexpr core::u64 kSignBit = static_cast<core::u64>(1) << 63;

// Two's-complement wrap-around without signed-overflow UB.
constexpr core::i64 wrappingAdd(core::i64 a, core::i64 b)
{
    return static_cast<core::i64>(static_cast<core::u64>(a) + static_cast<core::u64>(b));
}

constexpr core::i64 wrappingSub(core::i64 a, core::i64 b)
{
    return static_cast<core::i64>(static_cast<core::u64>(a) - static_cast<core::u64>(b));
}

constexpr core::u64 magnitude(core::i64 v)
{
    return v < 0 ? 0 - static_cast<core::u64>(v) : static_cast<core::u64>(v);
}

} // namespace detail

// -------------------------------------------------------------------------- //
//  Construction                                                              //
// -------------------------------------------------------------------------- //

constexpr FixedPoint::FixedPoint(core::i32 integer) : _raw{fromInt(integer)._raw} {}

constexpr FixedPoint::FixedPoint(core::f64 value) : _raw{fromDouble(value)._raw} {}

constexpr FixedPoint FixedPoint::fromRaw(raw_type raw)
{
    return FixedPoint{RawTag{}, raw};
}

constexpr FixedPoint FixedPoint::fromInt(core::i32 integer)
{
    // INT32_MIN scaled by 2^32 is the NaN encoding.
    if (integer == std::numeric_limits<core::i32>::min())
        return minValue();
    return fromRaw(static_cast<raw_type>(integer) * kOne);
}

constexpr FixedPoint FixedPoint::fromFloat(core::f32 f)
{
    return fromDouble(static_cast<core::f64>(f));
}

constexpr FixedPoint FixedPoint::fromDouble(core::f64 d)
{
    constexpr core::f64 kLimit = 9223372036854775808.0; // 2^63
    constexpr core::f64 kInf   = std::numeric_limits<core::f64>::infinity();

    if (d != d)
        return nan();
    if (d == kInf)
        return positiveInfinity();
    if (d == -kInf)
        return negativeInfinity();

    const core::f64 scaled = d * static_cast<core::f64>(kOne);
    if (scaled >= kLimit)
        return maxValue();
    if (scaled <= -kLimit)
        return minValue();
    return fromRaw(static_cast<raw_type>(scaled));
}

constexpr FixedPoint FixedPoint::fromBytes(std::span<const core::byte, kByteSize> bytes)
{
    core::u64 bits = 0;
    for (core::usize i = 0; i < kByteSize; ++i)
        bits |= static_cast<core::u64>(bytes[i]) << (8 * i);
    return fromRaw(static_cast<raw_type>(bits));
}

// -------------------------------------------------------------------------- //
//  Accessors & conversions                                                   //
// -------------------------------------------------------------------------- //

constexpr FixedPoint::raw_type FixedPoint::raw() const { return _raw; }

constexpr bool FixedPoint::isNaN()              const { return _raw == kNaNRaw; }
constexpr bool FixedPoint::isPositiveInfinity() const { return _raw == kPositiveInfinityRaw; }
constexpr bool FixedPoint::isNegativeInfinity() const { return _raw == kNegativeInfinityRaw; }
constexpr bool FixedPoint::isInfinity()         const { return isPositiveInfinity() || isNegativeInfinity(); }
constexpr bool FixedPoint::isFinite()           const { return !isNaN() && !isInfinity(); }

constexpr core::f32 FixedPoint::toFloat() const
{
    if (isNaN())
        return std::numeric_limits<core::f32>::quiet_NaN();
    if (isPositiveInfinity())
        return std::numeric_limits<core::f32>::infinity();
    if (isNegativeInfinity())
        return -std::numeric_limits<core::f32>::infinity();
    return static_cast<core::f32>(_raw) / static_cast<core::f32>(kOne);
}

constexpr core::f64 FixedPoint::toDouble() const
{
    if (isNaN())
        return std::numeric_limits<core::f64>::quiet_NaN();
    if (isPositiveInfinity())
        return std::numeric_limits<core::f64>::infinity();
    if (isNegativeInfinity())
        return -std::numeric_limits<core::f64>::infinity();
    return static_cast<core::f64>(_raw) / static_cast<core::f64>(kOne);
}

constexpr std::array<core::byte, FixedPoint::kByteSize> FixedPoint::toBytes() const
{
    std::array<core::byte, kByteSize> bytes{};
    const auto bits = static_cast<core::u64>(_raw);
    for (core::usize i = 0; i < kByteSize; ++i)
        bytes[i] = static_cast<core::byte>((bits >> (8 * i)) & 0xFFu);
    return bytes;
}

// -------------------------------------------------------------------------- //
//  Relational                                                                //
// -------------------------------------------------------------------------- //

constexpr bool operator==(FixedPoint lhs, FixedPoint rhs)
{
    if (lhs.isNaN() || rhs.isNaN())
        return false;
    return lhs._raw == rhs._raw;
}

constexpr bool operator!=(FixedPoint lhs, FixedPoint rhs)
{
    return !(lhs == rhs);
}

constexpr bool operator<(FixedPoint lhs, FixedPoint rhs)
{
    if (lhs.isNaN() || rhs.isNaN())
        return false;
    return lhs._raw < rhs._raw;
}

constexpr bool operator>(FixedPoint lhs, FixedPoint rhs)
{
    if (lhs.isNaN() || rhs.isNaN())
        return false;
    return lhs._raw > rhs._raw;
}

constexpr bool operator<=(FixedPoint lhs, FixedPoint rhs)
{
    if (lhs.isNaN() || rhs.isNaN())
        return false;
    return lhs._raw <= rhs._raw;
}

constexpr bool operator>=(FixedPoint lhs, FixedPoint rhs)
{
    if (lhs.isNaN() || rhs.isNaN())
        return false;
    return lhs._raw >= rhs._raw;
}

// -------------------------------------------------------------------------- //
//  Additive                                                                  //
// -------------------------------------------------------------------------- //

constexpr FixedPoint operator+(FixedPoint lhs, FixedPoint rhs)
{
    if (LOCKSTEP_UNLIKELY(lhs.isNaN() || rhs.isNaN()))
        return FixedPoint::nan();

    if (LOCKSTEP_UNLIKELY(lhs.isPositiveInfinity() || rhs.isPositiveInfinity()))
    {
        return (lhs.isNegativeInfinity() || rhs.isNegativeInfinity())
            ? FixedPoint::nan()
            : FixedPoint::positiveInfinity();
    }
    if (LOCKSTEP_UNLIKELY(lhs.isNegativeInfinity() || rhs.isNegativeInfinity()))
        return FixedPoint::negativeInfinity();

    return FixedPoint::fromRaw(detail::wrappingAdd(lhs._raw, rhs._raw));
}

constexpr FixedPoint operator-(FixedPoint lhs, FixedPoint rhs)
{
    if (LOCKSTEP_UNLIKELY(lhs.isNaN() || rhs.isNaN()))
        return FixedPoint::nan();

    if (LOCKSTEP_UNLIKELY(lhs.isPositiveInfinity()))
        return rhs.isPositiveInfinity() ? FixedPoint::nan() : FixedPoint::positiveInfinity();
    if (LOCKSTEP_UNLIKELY(lhs.isNegativeInfinity()))
        return rhs.isNegativeInfinity() ? FixedPoint::nan() : FixedPoint::negativeInfinity();
    if (LOCKSTEP_UNLIKELY(rhs.isPositiveInfinity()))
        return FixedPoint::negativeInfinity();
    if (LOCKSTEP_UNLIKELY(rhs.isNegativeInfinity()))
        return FixedPoint::positiveInfinity();

    return FixedPoint::fromRaw(detail::wrappingSub(lhs._raw, rhs._raw));
}

constexpr FixedPoint FixedPoint::operator-() const
{
    if (isNaN())
        return nan();
    // -(+Inf) lands on -Inf and -MaxValue on MinValue.
    return fromRaw(-_raw);
}

constexpr FixedPoint operator%(FixedPoint lhs, FixedPoint rhs)
{
    if (LOCKSTEP_UNLIKELY(lhs.isNaN() || rhs.isNaN()))
        return FixedPoint::nan();
    if (LOCKSTEP_UNLIKELY(rhs._raw == 0 || lhs.isInfinity()))
        return FixedPoint::nan();
    if (LOCKSTEP_UNLIKELY(rhs.isInfinity()))
        return lhs;

    return FixedPoint::fromRaw(lhs._raw % rhs._raw);
}

// -------------------------------------------------------------------------- //
//  Multiplicative                                                            //
// -------------------------------------------------------------------------- //

/*
 * (ia + fa) * (ib + fb), each operand split into its arithmetic-shifted
 * integer part and its unsigned 32-bit fraction.  fa * fb cannot exceed
 * 64 unsigned bits; the cross and integer terms wrap like native i64.
 */
constexpr FixedPoint operator*(FixedPoint lhs, FixedPoint rhs)
{
    if (LOCKSTEP_UNLIKELY(lhs.isNaN() || rhs.isNaN()))
        return FixedPoint::nan();

    if (LOCKSTEP_UNLIKELY(lhs.isInfinity() || rhs.isInfinity()))
    {
        if (lhs._raw == 0 || rhs._raw == 0)
            return FixedPoint::nan();
        return ((lhs._raw > 0) == (rhs._raw > 0))
            ? FixedPoint::positiveInfinity()
            : FixedPoint::negativeInfinity();
    }

    constexpr core::u32 kShift = FixedPoint::kFracBits;

    const auto fa = static_cast<core::u64>(lhs._raw) & static_cast<core::u64>(FixedPoint::kFractionMask);
    const auto fb = static_cast<core::u64>(rhs._raw) & static_cast<core::u64>(FixedPoint::kFractionMask);
    const auto ia = static_cast<core::u64>(lhs._raw >> kShift);
    const auto ib = static_cast<core::u64>(rhs._raw >> kShift);

    const core::u64 low   = (fa * fb) >> kShift;
    const core::u64 cross = fa * ib + fb * ia;
    const core::u64 high  = (ia * ib) << kShift;

    return FixedPoint::fromRaw(static_cast<FixedPoint::raw_type>(low + cross + high));
}

/*
 * Restoring binary long division over the magnitudes.  Running one step
 * per dividend bit plus kFracBits extra steps shifts the dividend left by
 * 2^32, so the quotient comes out already in Q32.32.
 */
constexpr FixedPoint operator/(FixedPoint lhs, FixedPoint rhs)
{
    if (LOCKSTEP_UNLIKELY(lhs.isNaN() || rhs.isNaN() || (lhs._raw == 0 && rhs._raw == 0)))
        return FixedPoint::nan();

    const bool positive = (lhs._raw ^ rhs._raw) >= 0;
    const FixedPoint signedInfinity = positive
        ? FixedPoint::positiveInfinity()
        : FixedPoint::negativeInfinity();

    if (LOCKSTEP_UNLIKELY(rhs._raw == 0))
        return signedInfinity;
    if (LOCKSTEP_UNLIKELY(lhs.isInfinity()))
        return rhs.isInfinity() ? FixedPoint::nan() : signedInfinity;
    if (LOCKSTEP_UNLIKELY(rhs.isInfinity()))
        return FixedPoint::zero();

    core::u64       dividend  = detail::magnitude(lhs._raw);
    const core::u64 divisor   = detail::magnitude(rhs._raw);
    core::u64       remainder = 0;
    core::u64       quotient  = 0;
    bool            overflow  = false;

    for (core::u32 i = 0; i < core::kDivisionSteps; ++i)
    {
        const bool carry = (dividend & detail::kSignBit) != 0;
        dividend <<= 1;
        remainder = (remainder << 1) | (carry ? 1u : 0u);

        overflow |= (quotient & detail::kSignBit) != 0;
        quotient <<= 1;
        if (remainder >= divisor)
        {
            quotient  |= 1u;
            remainder -= divisor;
        }
    }

    if (overflow || quotient > static_cast<core::u64>(FixedPoint::kMaxRaw))
        return signedInfinity;

    const auto q = static_cast<FixedPoint::raw_type>(quotient);
    return FixedPoint::fromRaw(positive ? q : -q);
}

// -------------------------------------------------------------------------- //
//  Compound assignment                                                       //
// -------------------------------------------------------------------------- //

constexpr FixedPoint &FixedPoint::operator+=(FixedPoint rhs)
{
    *this = *this + rhs;
    return *this;
}

constexpr FixedPoint &FixedPoint::operator-=(FixedPoint rhs)
{
    *this = *this - rhs;
    return *this;
}

constexpr FixedPoint &FixedPoint::operator*=(FixedPoint rhs)
{
    *this = *this * rhs;
    return *this;
}

constexpr FixedPoint &FixedPoint::operator/=(FixedPoint rhs)
{
    *this = *this / rhs;
    return *this;
}

constexpr FixedPoint &FixedPoint::operator%=(FixedPoint rhs)
{
    *this = *this % rhs;
    return *this;
}

// -------------------------------------------------------------------------- //
//  Constants                                                                 //
// -------------------------------------------------------------------------- //

constexpr FixedPoint FixedPoint::zero()      { return fromRaw(0); }
constexpr FixedPoint FixedPoint::one()       { return fromRaw(kOne); }
constexpr FixedPoint FixedPoint::half()      { return fromRaw(kOne >> 1); }
constexpr FixedPoint FixedPoint::precision() { return fromRaw(1); }

// Derived from fixed decimal literals through the regular conversion so
// that every build produces the same bits.
constexpr FixedPoint FixedPoint::pi()      { return fromDouble(3.1415926); }
constexpr FixedPoint FixedPoint::rad2Deg() { return fromFloat(57.29578f); }
constexpr FixedPoint FixedPoint::deg2Rad() { return fromFloat(0.01745f); }

constexpr FixedPoint FixedPoint::maxValue()         { return fromRaw(kMaxRaw); }
constexpr FixedPoint FixedPoint::minValue()         { return fromRaw(kMinRaw); }
constexpr FixedPoint FixedPoint::nan()              { return fromRaw(kNaNRaw); }
constexpr FixedPoint FixedPoint::positiveInfinity() { return fromRaw(kPositiveInfinityRaw); }
constexpr FixedPoint FixedPoint::negativeInfinity() { return fromRaw(kNegativeInfinityRaw); }

} // namespace lockstep::math

#endif // LOCKSTEP_MATH_FIXED_POINT_INL
