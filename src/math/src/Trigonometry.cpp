/**
 * @file Trigonometry.cpp
 * @brief Fixed-term Maclaurin series for sin and cos.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "lockstep/math/Trigonometry.hpp"

#include <lockstep/core/Assert.hpp>

namespace lockstep::math {

namespace {

/*
 * Sums c_i * x^i / i! for i in [1, kTaylorTerms] on top of @p constant.
 * c_i is +1 when i % 4 == phase, -1 when i % 4 == phase + 2, 0 otherwise:
 * phase 0 selects the cosine terms, phase 1 the sine terms.
 */
FixedPoint maclaurin(FixedPoint x, FixedPoint constant, core::u32 phase)
{
    FixedPoint sum       = constant;
    FixedPoint power     = x;
    core::i32  factorial = 1;

    for (core::u32 i = 1; i <= core::kTaylorTerms; ++i)
    {
        factorial *= static_cast<core::i32>(i);
        LOCKSTEP_ASSERT(factorial > 0);

        FixedPoint coefficient = 0;
        if (i % 4 == phase)
            coefficient = 1;
        else if (i % 4 == phase + 2)
            coefficient = -1;

        sum   += coefficient * power / factorial;
        power *= x;
    }
    return sum;
}

} // anonymous namespace

FixedPoint Trigonometry::sin(FixedPoint radians)
{
    if (radians.isNaN())
        return FixedPoint::nan();
    return maclaurin(radians, FixedPoint::zero(), 1);
}

FixedPoint Trigonometry::cos(FixedPoint radians)
{
    if (radians.isNaN())
        return FixedPoint::nan();
    return maclaurin(radians, FixedPoint::one(), 0);
}

FixedPoint Trigonometry::tan(FixedPoint radians)
{
    return sin(radians) / cos(radians);
}

FixedPoint Trigonometry::toRadians(FixedPoint degrees)
{
    return degrees * FixedPoint::deg2Rad();
}

FixedPoint Trigonometry::toDegrees(FixedPoint radians)
{
    return radians * FixedPoint::rad2Deg();
}

} // namespace lockstep::math
