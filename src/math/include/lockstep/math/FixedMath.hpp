/**
 * @file FixedMath.hpp
 * @brief Deterministic algebraic functions on FixedPoint values.
 *
 * Every routine runs a fixed amount of work that depends only on its
 * arguments (no adaptive convergence test), so results are bit-identical
 * on every peer of a lockstep session.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef LOCKSTEP_MATH_FIXED_MATH_HPP
    #define LOCKSTEP_MATH_FIXED_MATH_HPP

    #include "FixedPoint.hpp"

namespace lockstep::math {

class FixedMath final {
public:
    FixedMath() = delete;

    /**
     * @brief Absolute value, computed branch-free.
     * @param x Operand.
     * @return |x|; NaN stays NaN and both infinities map to +Inf.
     */
    [[nodiscard]] static FixedPoint abs(FixedPoint x);

    /**
     * @brief Integer power by repeated squaring.
     * @param base     Base value.
     * @param exponent Non-negative exponent.
     * @return base^exponent, NaN for a NaN base, or
     *         ErrorCode::InvalidArgument when @p exponent is negative.
     */
    [[nodiscard]] static core::Expected<FixedPoint> pow(FixedPoint base, core::i32 exponent);

    /**
     * @brief Square root by a fixed number of Newton-Raphson iterations.
     *
     * Seeds with x / 2 and runs core::kSqrtIterations steps.  Very small
     * inputs may not converge and yield NaN.
     *
     * @param x Operand.
     * @return sqrt(x), or ErrorCode::InvalidArgument when @p x is negative.
     */
    [[nodiscard]] static core::Expected<FixedPoint> sqrt(FixedPoint x);
};

} // namespace lockstep::math

#endif // LOCKSTEP_MATH_FIXED_MATH_HPP
