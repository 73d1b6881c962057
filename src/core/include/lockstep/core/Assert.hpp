/**
 * @file Assert.hpp
 * @brief Debug assertions with source location.
 *
 * LOCKSTEP_ASSERT is evaluated only when LOCKSTEP_DEBUG is defined; it logs
 * the failing expression together with the file, line, and function before
 * aborting.  In release builds it is a no-op.  Assertions guard internal
 * invariants only; domain errors are reported through core::Expected.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef LOCKSTEP_CORE_ASSERT_HPP
    #define LOCKSTEP_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace lockstep::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[LOCKSTEP ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace lockstep::core::detail

    #ifdef LOCKSTEP_DEBUG
        #define LOCKSTEP_ASSERT(cond)                                     \
            do {                                                           \
                if (LOCKSTEP_UNLIKELY(!(cond)))                            \
                    ::lockstep::core::detail::assertFail(#cond);           \
            } while (false)
    #else
        #define LOCKSTEP_ASSERT(cond) ((void)0)
    #endif

#endif // LOCKSTEP_CORE_ASSERT_HPP
