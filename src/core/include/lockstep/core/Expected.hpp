/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and a
 * LOCKSTEP_TRY macro for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef LOCKSTEP_CORE_EXPECTED_HPP
    #define LOCKSTEP_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace lockstep::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

} // namespace lockstep::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type lockstep::core::Expected<U>.
 */
#define LOCKSTEP_TRY(expr)                                                \
    ({                                                                     \
        auto &&_lockstep_result = (expr);                                  \
        if (!_lockstep_result.has_value()) [[unlikely]]                    \
            return std::unexpected(std::move(_lockstep_result.error()));    \
        std::move(_lockstep_result.value());                               \
    })

#endif // LOCKSTEP_CORE_EXPECTED_HPP
