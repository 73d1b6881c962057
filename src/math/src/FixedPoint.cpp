/**
 * @file FixedPoint.cpp
 * @brief Fallible conversions and text formatting for FixedPoint.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "lockstep/math/FixedPoint.hpp"

#include <lockstep/core/Assert.hpp>
#include <lockstep/core/Log.hpp>

#include <charconv>
#include <system_error>

namespace lockstep::math {

core::Expected<core::i32> FixedPoint::toInt() const
{
    if (isNaN())
    {
        core::Log::debug(core::kMathLogTag, "FixedPoint::toInt: NaN has no integer value");
        return core::makeError(core::ErrorCode::InvalidArgument, "NaN can't convert to int");
    }

    // Truncates toward zero; every non-NaN raw value fits an i32 here.
    return static_cast<core::i32>(_raw / kOne);
}

core::Expected<core::i32> FixedPoint::roundToInt() const
{
    const core::i64 integer = LOCKSTEP_TRY(toInt());

    // Two's-complement fraction bits of a negative value are not its
    // magnitude; complement them back.
    raw_type fraction = _raw & kFractionMask;
    if (_raw < 0)
        fraction = ~(fraction - 1) & kFractionMask;

    core::i64 rounded = integer;
    if (fraction >= half()._raw)
        rounded += (_raw >= 0) ? 1 : -1;

    if (rounded > std::numeric_limits<core::i32>::max() || rounded < std::numeric_limits<core::i32>::min())
    {
        core::Log::debug(core::kMathLogTag, "FixedPoint::roundToInt: result exceeds i32");
        return core::makeError(core::ErrorCode::OutOfRange, "Rounded value does not fit in int");
    }
    return static_cast<core::i32>(rounded);
}

std::string FixedPoint::toString() const
{
    if (isNaN())
        return "NaN";
    if (isPositiveInfinity())
        return "+Inf";
    if (isNegativeInfinity())
        return "-Inf";

    std::array<char, 32> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), toDouble());
    LOCKSTEP_ASSERT(ec == std::errc{});
    return std::string(buffer.data(), end);
}

} // namespace lockstep::math
