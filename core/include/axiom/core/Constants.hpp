/**
 * @file Constants.hpp
 * @brief Library-wide compile-time constants.
 *
 * Back-off tuning parameters are centralised here. Each one can be
 * overridden at build time by defining the matching AXIOM_BACKOFF_* macro
 * (the CMake cache variables of the same name forward them).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AXIOM_CORE_CONSTANTS_HPP
    #define AXIOM_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #ifndef AXIOM_BACKOFF_MIN_SPIN
        #define AXIOM_BACKOFF_MIN_SPIN 1
    #endif
    #ifndef AXIOM_BACKOFF_START_SPIN
        #define AXIOM_BACKOFF_START_SPIN 32
    #endif
    #ifndef AXIOM_BACKOFF_MAX_SPIN
        #define AXIOM_BACKOFF_MAX_SPIN 16384
    #endif
    #ifndef AXIOM_BACKOFF_YIELD_THRESHOLD
        #define AXIOM_BACKOFF_YIELD_THRESHOLD 1024
    #endif

namespace axiom::core {

inline constexpr u32 kBackOffMinSpin        = AXIOM_BACKOFF_MIN_SPIN;
inline constexpr u32 kBackOffStartSpin      = AXIOM_BACKOFF_START_SPIN;
inline constexpr u32 kBackOffMaxSpin        = AXIOM_BACKOFF_MAX_SPIN;
inline constexpr u32 kBackOffYieldThreshold = AXIOM_BACKOFF_YIELD_THRESHOLD;

/// Right shift applied by BackOff::relax().
inline constexpr u32 kBackOffRelaxShift     = 1;

static_assert(kBackOffMinSpin > 0, "back-off minimum must be non-zero");
static_assert(kBackOffMinSpin <= kBackOffStartSpin && kBackOffStartSpin <= kBackOffMaxSpin,
              "back-off start value must lie in [min, max]");
static_assert(kBackOffMaxSpin < (u32{1} << 31), "back-off maximum must survive doubling");

} // namespace axiom::core

#endif // AXIOM_CORE_CONSTANTS_HPP
