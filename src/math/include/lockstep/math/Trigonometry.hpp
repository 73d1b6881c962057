/**
 * @file Trigonometry.hpp
 * @brief Taylor-series trigonometric functions in fixed-point.
 *
 * Sine and cosine evaluate a truncated Maclaurin series with a fixed
 * number of terms (core::kTaylorTerms) and no lookup table.  No range
 * reduction is applied: accuracy is best near zero and degrades as |x|
 * grows, so callers should keep angles within [-pi, pi].
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef LOCKSTEP_MATH_TRIGONOMETRY_HPP
    #define LOCKSTEP_MATH_TRIGONOMETRY_HPP

    #include "FixedPoint.hpp"

namespace lockstep::math {

class Trigonometry final {
public:
    Trigonometry() = delete;

    /**
     * @brief Compute sine of an angle in radians.
     * @param radians Angle.
     * @return sin(radians); NaN for NaN.
     */
    [[nodiscard]] static FixedPoint sin(FixedPoint radians);

    /**
     * @brief Compute cosine of an angle in radians.
     * @param radians Angle.
     * @return cos(radians); NaN for NaN.
     */
    [[nodiscard]] static FixedPoint cos(FixedPoint radians);

    /**
     * @brief Compute tangent as sin / cos.
     *
     * No special handling near the poles beyond the division rules.
     */
    [[nodiscard]] static FixedPoint tan(FixedPoint radians);

    [[nodiscard]] static FixedPoint toRadians(FixedPoint degrees);
    [[nodiscard]] static FixedPoint toDegrees(FixedPoint radians);
};

} // namespace lockstep::math

#endif // LOCKSTEP_MATH_TRIGONOMETRY_HPP
