/**
 * @file FixedPoint.hpp
 * @brief Deterministic Q32.32 fixed-point arithmetic type.
 *
 * Replaces IEEE 754 floating-point for all simulation math to guarantee
 * bit-exact reproducibility across compilers, CPUs, and operating systems.
 * This is the numeric backbone of frame-synchronised (lockstep)
 * simulations: identical inputs on every peer yield identical raw values.
 *
 * The value is a single signed 64-bit integer with 32 fractional bits,
 * yielding a range of roughly [-2^31, +2^31) and a precision of 2^-32.
 * Three raw encodings are reserved as sentinels and never produced by
 * ordinary finite arithmetic:
 *
 *   NaN              = INT64_MIN
 *   NegativeInfinity = INT64_MIN + 1
 *   PositiveInfinity = INT64_MAX
 *
 * They propagate through the operators the way their IEEE counterparts do.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef LOCKSTEP_MATH_FIXED_POINT_HPP
    #define LOCKSTEP_MATH_FIXED_POINT_HPP

    #include <lockstep/core/Constants.hpp>
    #include <lockstep/core/Expected.hpp>
    #include <lockstep/core/Platform.hpp>
    #include <lockstep/core/Types.hpp>

    #include <array>
    #include <limits>
    #include <span>
    #include <string>

namespace lockstep::math {

class FixedPoint final {
public:
    using raw_type = core::i64;

    static constexpr core::u32 kFracBits     = core::kFractionBits;
    static constexpr raw_type  kOne          = static_cast<raw_type>(1) << kFracBits;
    static constexpr raw_type  kFractionMask = kOne - 1;
    static constexpr core::usize kByteSize   = sizeof(raw_type);

    static constexpr raw_type kNaNRaw              = std::numeric_limits<raw_type>::min();
    static constexpr raw_type kNegativeInfinityRaw = std::numeric_limits<raw_type>::min() + 1;
    static constexpr raw_type kPositiveInfinityRaw = std::numeric_limits<raw_type>::max();
    static constexpr raw_type kMaxRaw              = std::numeric_limits<raw_type>::max() - 1;
    static constexpr raw_type kMinRaw              = std::numeric_limits<raw_type>::min() + 2;

    constexpr FixedPoint() = default;

    /// @brief Implicit conversion from a native integer (scaled by 2^32).
    constexpr FixedPoint(core::i32 integer);

    /**
     * @brief Implicit conversion from a native double (scaled by 2^32,
     *        truncated toward zero).
     *
     * This is the one entry point whose result depends on native
     * floating-point arithmetic; feed it only values that are themselves
     * deterministic (literals, configuration).
     */
    constexpr FixedPoint(core::f64 value);

    /// @brief Construct from a raw bit pattern. No validation is performed.
    [[nodiscard]] static constexpr FixedPoint fromRaw(raw_type raw);
    [[nodiscard]] static constexpr FixedPoint fromInt(core::i32 integer);
    [[nodiscard]] static constexpr FixedPoint fromFloat(core::f32 f);
    [[nodiscard]] static constexpr FixedPoint fromDouble(core::f64 d);

    /// @brief Rebuild a value from its little-endian byte encoding.
    [[nodiscard]] static constexpr FixedPoint fromBytes(std::span<const core::byte, kByteSize> bytes);

    [[nodiscard]] constexpr raw_type raw() const;

    [[nodiscard]] constexpr bool isNaN()              const;
    [[nodiscard]] constexpr bool isPositiveInfinity() const;
    [[nodiscard]] constexpr bool isNegativeInfinity() const;
    [[nodiscard]] constexpr bool isInfinity()         const;
    [[nodiscard]] constexpr bool isFinite()           const;

    [[nodiscard]] constexpr core::f32 toFloat()  const;
    [[nodiscard]] constexpr core::f64 toDouble() const;

    /**
     * @brief Integer part, truncated toward zero.
     * @return The integer, or ErrorCode::InvalidArgument for NaN.
     */
    [[nodiscard]] core::Expected<core::i32> toInt() const;

    /**
     * @brief Nearest integer, halves rounded away from zero.
     * @return The integer, ErrorCode::InvalidArgument for NaN, or
     *         ErrorCode::OutOfRange when the result does not fit an i32.
     */
    [[nodiscard]] core::Expected<core::i32> roundToInt() const;

    /// @brief Shortest round-trip decimal text, locale independent.
    [[nodiscard]] std::string toString() const;

    /// @brief Raw value as 8 little-endian bytes, identical on every host.
    [[nodiscard]] constexpr std::array<core::byte, kByteSize> toBytes() const;

    constexpr FixedPoint  operator- () const;

    constexpr FixedPoint &operator+=(FixedPoint rhs);
    constexpr FixedPoint &operator-=(FixedPoint rhs);
    constexpr FixedPoint &operator*=(FixedPoint rhs);
    constexpr FixedPoint &operator/=(FixedPoint rhs);
    constexpr FixedPoint &operator%=(FixedPoint rhs);

    friend constexpr FixedPoint operator+(FixedPoint lhs, FixedPoint rhs);
    friend constexpr FixedPoint operator-(FixedPoint lhs, FixedPoint rhs);
    friend constexpr FixedPoint operator*(FixedPoint lhs, FixedPoint rhs);
    friend constexpr FixedPoint operator/(FixedPoint lhs, FixedPoint rhs);
    friend constexpr FixedPoint operator%(FixedPoint lhs, FixedPoint rhs);

    // NaN is unordered and unequal to everything, itself included.
    friend constexpr bool operator==(FixedPoint lhs, FixedPoint rhs);
    friend constexpr bool operator!=(FixedPoint lhs, FixedPoint rhs);
    friend constexpr bool operator< (FixedPoint lhs, FixedPoint rhs);
    friend constexpr bool operator> (FixedPoint lhs, FixedPoint rhs);
    friend constexpr bool operator<=(FixedPoint lhs, FixedPoint rhs);
    friend constexpr bool operator>=(FixedPoint lhs, FixedPoint rhs);

    static constexpr FixedPoint zero();
    static constexpr FixedPoint one();
    static constexpr FixedPoint half();
    static constexpr FixedPoint pi();
    static constexpr FixedPoint rad2Deg();
    static constexpr FixedPoint deg2Rad();
    static constexpr FixedPoint precision();
    static constexpr FixedPoint maxValue();
    static constexpr FixedPoint minValue();
    static constexpr FixedPoint nan();
    static constexpr FixedPoint positiveInfinity();
    static constexpr FixedPoint negativeInfinity();

private:
    struct RawTag {};

    constexpr FixedPoint(RawTag, raw_type raw) : _raw{raw} {}

    raw_type _raw = 0;
};

} // namespace lockstep::math

    #include "FixedPoint.inl"

#endif // LOCKSTEP_MATH_FIXED_POINT_HPP
