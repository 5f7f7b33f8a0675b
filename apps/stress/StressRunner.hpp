// /////////////////////////////////////////////////////////////////////////////
/// @file StressRunner.hpp
/// @brief Hammers a process-wide SpinLock-protected counter from many threads.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include "StressConfig.hpp"

#include <axiom/core/Types.hpp>

namespace axiom::stress {

/// @brief Outcome of one stress run.
struct StressReport {
    core::i64 finalValue{0};
    core::i64 expectedValue{0};
    core::u64 failedClaims{0};   ///< tryLockFor calls that ran out of attempts
    core::f64 elapsedMs{0.0};

    [[nodiscard]] bool passed() const noexcept { return finalValue == expectedValue; }
};

/// @brief Resets the shared counter, runs every worker to completion and
///        reports the final value.
///
/// Runs must not overlap: they all share one static lock.
[[nodiscard]] StressReport runStress(const StressConfig& config);

} // namespace axiom::stress
