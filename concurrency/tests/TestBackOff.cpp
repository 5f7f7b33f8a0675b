/**
 * @file TestBackOff.cpp
 * @brief Unit tests for concurrency::BackOff.
 */

#include <catch2/catch.hpp>

#include <axiom/concurrency/BackOff.hpp>
#include <axiom/core/Constants.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <limits>
#include <thread>

namespace axiom::concurrency {

using core::kBackOffMaxSpin;
using core::kBackOffMinSpin;
using core::kBackOffStartSpin;
using core::kBackOffYieldThreshold;

TEST_CASE("BackOff starts at the configured value", "[concurrency][backoff]")
{
    SECTION("default start")
    {
        BackOff backOff;
        REQUIRE(backOff.current() == kBackOffStartSpin);
    }

    SECTION("explicit start inside the range")
    {
        const core::u32 start = BackOff::clamp(kBackOffStartSpin * 2);
        BackOff backOff{start};
        REQUIRE(backOff.current() == start);
    }

    SECTION("explicit start below the minimum is clamped")
    {
        BackOff backOff{0};
        REQUIRE(backOff.current() == kBackOffMinSpin);
    }

    SECTION("explicit start above the maximum is clamped")
    {
        BackOff backOff{std::numeric_limits<core::u32>::max()};
        REQUIRE(backOff.current() == kBackOffMaxSpin);
        REQUIRE(backOff.isCompleted());
    }
}

TEST_CASE("BackOff::wait doubles the counter up to the maximum", "[concurrency][backoff]")
{
    BackOff backOff;
    core::u32 previous = backOff.current();

    while (!backOff.isCompleted())
    {
        backOff.wait();
        REQUIRE(backOff.current() == std::min(previous * 2, kBackOffMaxSpin));
        previous = backOff.current();
    }

    for (int i = 0; i < 4; ++i)
    {
        backOff.wait();
        REQUIRE(backOff.current() == kBackOffMaxSpin);
    }
}

TEST_CASE("BackOff::wait caps a non power of two start", "[concurrency][backoff]")
{
    BackOff backOff{kBackOffMaxSpin - 1};
    backOff.wait();
    REQUIRE(backOff.current() == kBackOffMaxSpin);
}

TEST_CASE("BackOff::relax halves without going below the minimum", "[concurrency][backoff]")
{
    SECTION("from the maximum")
    {
        BackOff backOff{kBackOffMaxSpin};
        backOff.relax();
        REQUIRE(backOff.current() == BackOff::clamp(kBackOffMaxSpin >> 1));
        REQUIRE(backOff.current() < kBackOffMaxSpin);
    }

    SECTION("after growth")
    {
        BackOff backOff;
        for (int i = 0; i < 5; ++i)
        {
            backOff.wait();
        }
        const core::u32 before = backOff.current();
        backOff.relax();
        REQUIRE(backOff.current() < before);
    }

    SECTION("repeated relax floors at the minimum")
    {
        BackOff backOff{kBackOffMaxSpin};
        for (int i = 0; i < 64; ++i)
        {
            backOff.relax();
            REQUIRE(backOff.current() >= kBackOffMinSpin);
        }
        REQUIRE(backOff.current() == kBackOffMinSpin);
    }
}

TEST_CASE("BackOff::reset and resetTo", "[concurrency][backoff]")
{
    BackOff backOff;
    for (int i = 0; i < 5; ++i)
    {
        backOff.wait();
    }
    REQUIRE(backOff.current() > kBackOffStartSpin);

    SECTION("reset restores the start value")
    {
        backOff.reset();
        REQUIRE(backOff.current() == kBackOffStartSpin);
    }

    SECTION("resetTo sets an in-range value")
    {
        backOff.resetTo(kBackOffMinSpin);
        REQUIRE(backOff.current() == kBackOffMinSpin);
    }

    SECTION("resetTo clamps out-of-range values")
    {
        backOff.resetTo(0);
        REQUIRE(backOff.current() == kBackOffMinSpin);

        backOff.resetTo(std::numeric_limits<core::u32>::max());
        REQUIRE(backOff.current() == kBackOffMaxSpin);
    }
}

#if AXIOM_ENABLE_YIELD
TEST_CASE("BackOff::yieldNow returns to the caller", "[concurrency][backoff]")
{
    BackOff::yieldNow();
    SUCCEED();
}
#endif

TEST_CASE("BackOff::wait keeps working above the yield threshold", "[concurrency][backoff]")
{
    BackOff backOff{BackOff::clamp(kBackOffYieldThreshold + 1)};
    REQUIRE((backOff.current() > kBackOffYieldThreshold || backOff.isCompleted()));

    core::u32 waits = 0;
    while (!backOff.isCompleted() && waits < 64)
    {
        const core::u32 before = backOff.current();
        backOff.wait();
        ++waits;
        REQUIRE(backOff.current() == std::min(before * 2, kBackOffMaxSpin));
    }
    REQUIRE(backOff.isCompleted());

    for (int i = 0; i < 8; ++i)
    {
        backOff.wait();
        REQUIRE(backOff.current() == kBackOffMaxSpin);
    }

    if constexpr (kBackOffMinSpin < kBackOffMaxSpin)
    {
        backOff.relax();
        const core::u32 relaxed = backOff.current();
        REQUIRE(relaxed < kBackOffMaxSpin);
        backOff.wait();
        REQUIRE(backOff.current() == std::min(relaxed * 2, kBackOffMaxSpin));
    }
}

TEST_CASE("BackOff paces a standalone busy-wait loop", "[concurrency][backoff]")
{
    std::atomic<bool> ready{false};

    std::thread producer([&ready] {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
        ready.store(true, std::memory_order_release);
    });

    BackOff backOff;
    core::u32 waits = 0;
    while (!ready.load(std::memory_order_acquire))
    {
        backOff.wait();
        ++waits;
    }
    producer.join();

    REQUIRE(ready.load());
    REQUIRE(backOff.current() <= kBackOffMaxSpin);
    REQUIRE(backOff.current() >= kBackOffMinSpin);
    if (waits > 0)
    {
        REQUIRE(backOff.current() >= kBackOffStartSpin);
    }
}

} // namespace axiom::concurrency
