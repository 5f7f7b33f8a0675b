// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief axiom_stress entry-point.
///
/// Spawns many threads that each increment a shared SpinLock-protected
/// counter and exits non-zero if any increment was lost.
// /////////////////////////////////////////////////////////////////////////////

#include "StressConfig.hpp"
#include "StressRunner.hpp"

#include <axiom/core/Log.hpp>
#include <axiom/core/Platform.hpp>

#include <cstdio>
#include <format>
#include <string_view>
#include <vector>

using namespace axiom;

int main(int argc, char* argv[])
{
    const std::vector<std::string_view> args(argv + 1, argv + argc);

    auto config = stress::parseArgs(args);
    if (!config)
    {
        core::Log::error("stress", std::format("{}: {}", core::toString(config.error().code()),
                                               config.error().message()));
        std::fprintf(stderr, "%.*s\n", static_cast<int>(stress::usage().size()), stress::usage().data());
        return 2;
    }
    if (config->showHelp())
    {
        std::printf("%.*s\n", static_cast<int>(stress::usage().size()), stress::usage().data());
        return 0;
    }

    core::Log::info("stress", std::format("=== axiom spin-lock stress: {} threads x {} increments, mode '{}', yield {} ===",
                                          config->threads(), config->iterations(),
                                          stress::toString(config->mode()),
                                          AXIOM_ENABLE_YIELD ? "on" : "off"));

    const stress::StressReport report = stress::runStress(*config);

    core::Log::info("stress", std::format("final counter value: {} (expected {})",
                                          report.finalValue, report.expectedValue));
    core::Log::info("stress", std::format("elapsed: {:.3f} ms, exhausted tryLockFor calls: {}",
                                          report.elapsedMs, report.failedClaims));

    if (!report.passed())
    {
        core::Log::error("stress", std::format("lost {} increments",
                                               report.expectedValue - report.finalValue));
        return 1;
    }

    core::Log::info("stress", "no lost increments");
    return 0;
}
