/**
 * @file TestStressRunner.cpp
 * @brief Runs the stress harness in every mode with a small workload.
 */

#include <catch2/catch.hpp>

#include "StressRunner.hpp"

namespace axiom::stress {

TEST_CASE("runStress loses no increments", "[stress][runner]")
{
    const auto mode = GENERATE(StressMode::kLock, StressMode::kTryLock, StressMode::kWithLock);

    const auto config = StressConfig::Builder{}
        .threads(8)
        .iterations(50'000)
        .mode(mode)
        .tryLockSpins(4)
        .build();
    REQUIRE(config.has_value());

    const StressReport report = runStress(*config);

    REQUIRE(report.expectedValue == 400'000);
    REQUIRE(report.finalValue == report.expectedValue);
    REQUIRE(report.passed());
    REQUIRE(report.elapsedMs >= 0.0);
    if (mode != StressMode::kTryLock)
    {
        REQUIRE(report.failedClaims == 0);
    }
}

TEST_CASE("runStress resets the shared counter between runs", "[stress][runner]")
{
    const auto config = StressConfig::Builder{}.threads(2).iterations(1'000).build();
    REQUIRE(config.has_value());

    REQUIRE(runStress(*config).finalValue == 2'000);
    REQUIRE(runStress(*config).finalValue == 2'000);
}

} // namespace axiom::stress
