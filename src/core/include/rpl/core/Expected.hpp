/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * RPL_TRY / RPL_TRY_VOID macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RPL_CORE_EXPECTED_HPP
    #define RPL_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace rpl::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace rpl::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type rpl::core::Expected<U>.
 */
#define RPL_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_rpl_result = (expr);                                       \
        if (!_rpl_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_rpl_result.error()));         \
        std::move(_rpl_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type rpl::core::ExpectedVoid.
 */
#define RPL_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_rpl_result = (expr);                                       \
        if (!_rpl_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_rpl_result.error()));         \
    } while (false)

#endif // RPL_CORE_EXPECTED_HPP
