/**
 * @file BackOff.hpp
 * @brief Exponential back-off counter for busy-wait loops.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef AXIOM_CONCURRENCY_BACKOFF_HPP
    #define AXIOM_CONCURRENCY_BACKOFF_HPP

#include <axiom/core/Platform.hpp>
#include <axiom/core/Constants.hpp>
#include <axiom/core/NonCopyable.hpp>
#include <axiom/core/Types.hpp>

#include <algorithm>
#include <atomic>

namespace axiom::concurrency {

/**
 * @class BackOff
 * @brief Adaptive exponential back-off.
 *
 * Each @ref wait spins for @ref current iterations of the CPU pause hint and
 * then doubles the counter, capped at core::kBackOffMaxSpin. Once the counter
 * has grown past core::kBackOffYieldThreshold, and the build enables
 * AXIOM_ENABLE_YIELD, every wait also yields the rest of the time slice once.
 *
 * The counter always lies in [core::kBackOffMinSpin, core::kBackOffMaxSpin].
 * It is stored atomically so a shared instance is memory-safe, but the
 * policy only makes sense for the thread that is actually retrying.
 *
 * @code
 * BackOff backOff;
 * while (!tryAcquire())
 *     backOff.wait();
 * @endcode
 */
class BackOff final : public core::NonCopyable<BackOff>
{
public:
    /** @brief Starts at core::kBackOffStartSpin. */
    constexpr BackOff() noexcept = default;

    /**
     * @brief Starts at @p start, clamped into the allowed range.
     * @param start Initial spin count.
     */
    constexpr explicit BackOff(core::u32 start) noexcept
        : _spin{clamp(start)}
    {
    }

    /** @brief Spins, grows the counter, and yields past the threshold. */
    void wait() noexcept;

    /** @brief Halves the counter, never below core::kBackOffMinSpin. */
    void relax() noexcept;

    /** @brief Restores core::kBackOffStartSpin. */
    void reset() noexcept;

    /**
     * @brief Sets the counter to @p spin, clamped into range.
     * @param spin New spin count.
     */
    void resetTo(core::u32 spin) noexcept;

    [[nodiscard]] core::u32 current() const noexcept
    {
        return _spin.load(std::memory_order_relaxed);
    }

    /**
     * @brief Whether the counter has saturated at core::kBackOffMaxSpin.
     *
     * Callers can use it to switch to another waiting strategy once further
     * waits stop growing.
     */
    [[nodiscard]] bool isCompleted() const noexcept
    {
        return current() >= core::kBackOffMaxSpin;
    }

#if AXIOM_ENABLE_YIELD
    /** @brief Yields the remaining time slice of the calling thread. */
    static void yieldNow() noexcept;
#endif

    [[nodiscard]] static constexpr core::u32 clamp(core::u32 spin) noexcept
    {
        return std::clamp(spin, core::kBackOffMinSpin, core::kBackOffMaxSpin);
    }

private:
    std::atomic<core::u32> _spin{core::kBackOffStartSpin};
};

} // namespace axiom::concurrency

#endif // AXIOM_CONCURRENCY_BACKOFF_HPP
