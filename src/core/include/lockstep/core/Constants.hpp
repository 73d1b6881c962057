/**
 * @file Constants.hpp
 * @brief Library-wide compile-time constants.
 *
 * Every parameter that shapes a numeric result bit-for-bit is centralised
 * here.  Changing any of them changes simulation output, so peers running
 * the same lockstep session must be built with identical values.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef LOCKSTEP_CORE_CONSTANTS_HPP
    #define LOCKSTEP_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <string_view>

namespace lockstep::core {

inline constexpr u32 kRawBits        = 64;
inline constexpr u32 kFractionBits   = 32;
inline constexpr u32 kDivisionSteps  = kRawBits + kFractionBits;

inline constexpr u32 kSqrtIterations = 10;
inline constexpr u32 kTaylorTerms    = 10;

inline constexpr std::string_view kDefaultLogTag = "lockstep";
inline constexpr std::string_view kMathLogTag    = "math";

} // namespace lockstep::core

#endif // LOCKSTEP_CORE_CONSTANTS_HPP
