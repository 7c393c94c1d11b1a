/**
 * @file Expected.hpp
 * @brief Error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * PTS_TRY macro for early-return propagation.
 *
 * @author siiir
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PTS_CORE_EXPECTED_HPP
    #define PTS_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace pts::core {

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

} // namespace pts::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type pts::core::Expected<U>.
 */
#define PTS_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_pts_result = (expr);                                       \
        if (!_pts_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_pts_result.error()));        \
        std::move(_pts_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type pts::core::ExpectedVoid.
 */
#define PTS_TRY_VOID(expr)                                                \
    do {                                                                   \
        auto &&_pts_result = (expr);                                       \
        if (!_pts_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_pts_result.error()));        \
    } while (false)

#endif // PTS_CORE_EXPECTED_HPP
