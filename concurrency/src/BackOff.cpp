/**
 * @file BackOff.cpp
 * @brief Implementation of the exponential back-off counter.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <axiom/concurrency/BackOff.hpp>

#if AXIOM_ENABLE_YIELD
    #include <thread>
#endif

namespace axiom::concurrency {

// -------------------------------------------------------------------------- //
//  Waiting                                                                   //
// -------------------------------------------------------------------------- //

void BackOff::wait() noexcept
{
    const core::u32 spins = _spin.load(std::memory_order_relaxed);

    for (core::u32 i = 0; i < spins; ++i)
    {
        AXIOM_CPU_PAUSE();
    }

    _spin.store(std::min(spins << 1, core::kBackOffMaxSpin), std::memory_order_relaxed);

#if AXIOM_ENABLE_YIELD
    if (spins > core::kBackOffYieldThreshold)
    {
        yieldNow();
    }
#endif
}

#if AXIOM_ENABLE_YIELD
void BackOff::yieldNow() noexcept
{
    std::this_thread::yield();
}
#endif

// -------------------------------------------------------------------------- //
//  Counter adjustment                                                        //
// -------------------------------------------------------------------------- //

void BackOff::relax() noexcept
{
    const core::u32 spins = _spin.load(std::memory_order_relaxed);
    _spin.store(clamp(spins >> core::kBackOffRelaxShift), std::memory_order_relaxed);
}

void BackOff::reset() noexcept
{
    _spin.store(core::kBackOffStartSpin, std::memory_order_relaxed);
}

void BackOff::resetTo(core::u32 spin) noexcept
{
    _spin.store(clamp(spin), std::memory_order_relaxed);
}

} // namespace axiom::concurrency
