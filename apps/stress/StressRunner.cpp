// /////////////////////////////////////////////////////////////////////////////
/// @file StressRunner.cpp
/// @brief Worker threads and timing for the stress harness.
// /////////////////////////////////////////////////////////////////////////////

#include "StressRunner.hpp"

#include <axiom/concurrency/SpinLock.hpp>
#include <axiom/core/Assert.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

namespace axiom::stress {

namespace {

constinit concurrency::SpinLock<core::i64> gCounter{0};

void incrementLoop(const StressConfig& config, std::atomic<core::u64>& failedClaims)
{
    core::u64 failed = 0;

    for (core::u64 i = 0; i < config.iterations(); ++i)
    {
        switch (config.mode())
        {
            case StressMode::kLock:
                ++*gCounter.lock();
                break;

            case StressMode::kTryLock:
                for (;;)
                {
                    if (auto guard = gCounter.tryLockFor(config.tryLockSpins()))
                    {
                        ++**guard;
                        break;
                    }
                    ++failed;
                }
                break;

            case StressMode::kWithLock:
                gCounter.withLock([](core::i64& value) noexcept { ++value; });
                break;
        }
    }

    failedClaims.fetch_add(failed, std::memory_order_relaxed);
}

} // namespace

StressReport runStress(const StressConfig& config)
{
    AXIOM_VERIFY(config.threads() > 0);

    *gCounter.lock() = 0;
    std::atomic<core::u64> failedClaims{0};

    const auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> workers;
    workers.reserve(config.threads());
    for (core::u32 t = 0; t < config.threads(); ++t)
    {
        workers.emplace_back(incrementLoop, std::cref(config), std::ref(failedClaims));
    }
    for (auto& worker : workers)
    {
        worker.join();
    }

    const auto end = std::chrono::steady_clock::now();

    StressReport report;
    report.finalValue    = *gCounter.lock();
    report.expectedValue = static_cast<core::i64>(config.expectedTotal());
    report.failedClaims  = failedClaims.load(std::memory_order_relaxed);
    report.elapsedMs     = std::chrono::duration<core::f64, std::milli>(end - start).count();
    return report;
}

} // namespace axiom::stress
