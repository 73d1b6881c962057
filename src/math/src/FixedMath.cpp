/**
 * @file FixedMath.cpp
 * @brief Power, square root, and absolute value for FixedPoint.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "lockstep/math/FixedMath.hpp"

#include <lockstep/core/Log.hpp>

namespace lockstep::math {

namespace {

FixedPoint powBySquaring(FixedPoint base, core::i32 exponent)
{
    if (exponent == 0)
        return FixedPoint::one();
    if (exponent == 1)
        return base;

    const FixedPoint root    = powBySquaring(base, exponent / 2);
    const FixedPoint squared = root * root;
    return (exponent % 2 == 0) ? squared : squared * base;
}

} // anonymous namespace

FixedPoint FixedMath::abs(FixedPoint x)
{
    if (x.isNaN())
        return FixedPoint::nan();

    const FixedPoint::raw_type mask = x.raw() >> 63;
    return FixedPoint::fromRaw((x.raw() + mask) ^ mask);
}

core::Expected<FixedPoint> FixedMath::pow(FixedPoint base, core::i32 exponent)
{
    if (exponent < 0)
    {
        core::Log::debug(core::kMathLogTag, "FixedMath::pow: negative exponent");
        return core::makeError(core::ErrorCode::InvalidArgument, "Exponent can't be negative");
    }
    if (base.isNaN())
        return FixedPoint::nan();

    return powBySquaring(base, exponent);
}

core::Expected<FixedPoint> FixedMath::sqrt(FixedPoint x)
{
    if (x.isNaN())
        return FixedPoint::nan();
    if (x == FixedPoint::zero())
        return FixedPoint::zero();
    if (x < FixedPoint::zero())
    {
        core::Log::debug(core::kMathLogTag, "FixedMath::sqrt: negative operand");
        return core::makeError(core::ErrorCode::InvalidArgument, "Input number can't be negative");
    }
    if (x.isPositiveInfinity())
        return x;

    FixedPoint r = x * FixedPoint::half();
    for (core::u32 i = 0; i < core::kSqrtIterations; ++i)
        r -= (r * r - x) / (2 * r);

    return r;
}

} // namespace lockstep::math
