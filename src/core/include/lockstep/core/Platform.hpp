/**
 * @file Platform.hpp
 * @brief Compiler detection and portability macros.
 *
 * Provides branch-prediction hints for the special-value checks on the
 * hot arithmetic paths of the fixed-point type.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef LOCKSTEP_CORE_PLATFORM_HPP
    #define LOCKSTEP_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define LOCKSTEP_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define LOCKSTEP_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define LOCKSTEP_COMPILER_MSVC  1
    #else
        #define LOCKSTEP_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(LOCKSTEP_COMPILER_GCC) || defined(LOCKSTEP_COMPILER_CLANG)
        #define LOCKSTEP_LIKELY(x)      __builtin_expect(!!(x), 1)
        #define LOCKSTEP_UNLIKELY(x)    __builtin_expect(!!(x), 0)
    #elif defined(LOCKSTEP_COMPILER_MSVC)
        #define LOCKSTEP_LIKELY(x)      (x)
        #define LOCKSTEP_UNLIKELY(x)    (x)
    #else
        #define LOCKSTEP_LIKELY(x)      (x)
        #define LOCKSTEP_UNLIKELY(x)    (x)
    #endif

#endif // LOCKSTEP_CORE_PLATFORM_HPP
