/**
 * @file NonCopyable.hpp
 * @brief CRTP base classes that delete copy (and optionally move)
 *        operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AXIOM_CORE_NON_COPYABLE_HPP
    #define AXIOM_CORE_NON_COPYABLE_HPP

namespace axiom::core {

/**
 * @brief Inherit to disable copy construction and assignment.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    constexpr NonCopyable() = default;
    ~NonCopyable()          = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)      = default;
};

/**
 * @brief Inherit to pin an object to its address (no copy, no move).
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonMovable {
protected:
    constexpr NonMovable() = default;
    ~NonMovable()          = default;

    NonMovable(const NonMovable &)            = delete;
    NonMovable &operator=(const NonMovable &) = delete;

    NonMovable(NonMovable &&)                 = delete;
    NonMovable &operator=(NonMovable &&)      = delete;
};

} // namespace axiom::core

#endif // AXIOM_CORE_NON_COPYABLE_HPP
