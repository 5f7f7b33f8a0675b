/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * AXIOM_TRY macro for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AXIOM_CORE_EXPECTED_HPP
    #define AXIOM_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace axiom::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

} // namespace axiom::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once. If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type axiom::core::Expected<U>.
 */
#define AXIOM_TRY(expr)                                                   \
    ({                                                                     \
        auto &&_axiom_result = (expr);                                     \
        if (!_axiom_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_axiom_result.error()));       \
        std::move(_axiom_result.value());                                  \
    })

#endif // AXIOM_CORE_EXPECTED_HPP
