/**
 * @file SpinLock.hpp
 * @brief Value-owning test-and-set spin-lock with exponential back-off.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef AXIOM_CONCURRENCY_SPINLOCK_HPP
    #define AXIOM_CONCURRENCY_SPINLOCK_HPP

#include <axiom/concurrency/BackOff.hpp>
#include <axiom/core/Assert.hpp>
#include <axiom/core/NonCopyable.hpp>
#include <axiom/core/Types.hpp>

#include <atomic>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace axiom::concurrency {

template <typename T>
class SpinLock;

namespace detail {

/** @brief Address unique to the calling thread, used to tag the owner. */
[[nodiscard]] inline const void *threadTag() noexcept
{
    thread_local const char tag = 0;
    return &tag;
}

} // namespace detail

/**
 * @class SpinGuard
 * @brief Scoped, exclusive access to the value inside a SpinLock.
 *
 * Only a successful acquisition on SpinLock produces a guard. The lock is
 * released when the guard is destroyed, whichever way its scope is left
 * (fall-through, early return, exception).
 *
 * Guards can be moved, which is what lets them travel inside
 * @c std::optional; a moved-from guard owns nothing and must not be
 * dereferenced.
 */
template <typename T>
class SpinGuard final : public core::NonCopyable<SpinGuard<T>>
{
public:
    SpinGuard(SpinGuard &&other) noexcept
        : core::NonCopyable<SpinGuard<T>>{},
          _lock{std::exchange(other._lock, nullptr)}
    {
    }

    SpinGuard &operator=(SpinGuard &&) = delete;

    /** @brief Releases the lock if this guard still owns it. */
    ~SpinGuard() noexcept
    {
        if (_lock != nullptr)
        {
            _lock->unlockUnchecked();
        }
    }

    [[nodiscard]] T &get() noexcept
    {
        AXIOM_ASSERT(_lock != nullptr);
        return _lock->_value;
    }

    [[nodiscard]] const T &get() const noexcept
    {
        AXIOM_ASSERT(_lock != nullptr);
        return _lock->_value;
    }

    T       &operator*() noexcept        { return get(); }
    const T &operator*() const noexcept  { return get(); }
    T       *operator->() noexcept       { return &get(); }
    const T *operator->() const noexcept { return &get(); }

    /**
     * @brief Detaches the guard without releasing the lock.
     *
     * The lock stays held after the guard is gone. The caller becomes
     * responsible for calling SpinLock::unlockUnchecked() exactly once.
     *
     * @return The lock that is still held.
     */
    [[nodiscard]] SpinLock<T> *release() noexcept
    {
        return std::exchange(_lock, nullptr);
    }

private:
    friend class SpinLock<T>;

    explicit SpinGuard(SpinLock<T> &lock) noexcept
        : _lock{&lock}
    {
    }

    SpinLock<T> *_lock;
};

/**
 * @class SpinLock
 * @brief Test-and-test-and-set spin-lock owning the value it protects.
 *
 * The value is reachable only through a SpinGuard (or @ref withLock), so at
 * most one thread touches it at a time. A successful claim uses acquire
 * ordering and a release uses release ordering: the new holder sees every
 * write made under the previous guard.
 *
 * There is no fairness and no wait queue; a waiter can be overtaken
 * indefinitely. The lock is not reentrant: locking it again from the
 * holding thread spins forever (debug builds assert instead).
 *
 * Construction is @c constexpr and allocation-free, so a namespace-scope
 * instance is constant-initialized:
 * @code
 * constinit SpinLock<core::u32> gCounter{0};
 *
 * void bump() { ++*gCounter.lock(); }
 * @endcode
 *
 * Suitable for very short critical sections only; never hold one across a
 * blocking call.
 */
template <typename T>
class SpinLock final : public core::NonMovable<SpinLock<T>>
{
public:
    using value_type = T;
    using guard_type = SpinGuard<T>;

    constexpr SpinLock() noexcept(std::is_nothrow_default_constructible_v<T>)
        requires std::is_default_constructible_v<T>
        : _value{}
    {
    }

    constexpr explicit SpinLock(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : _value{std::move(value)}
    {
    }

    /** @brief Constructs the protected value in place from @p args. */
    template <typename... Args>
    constexpr explicit SpinLock(std::in_place_t, Args &&...args)
        : _value(std::forward<Args>(args)...)
    {
    }

    /**
     * @brief Acquires the lock, spinning with back-off until it is free.
     *
     * Every failed claim waits on a local BackOff, and the waiter keeps
     * backing off while a relaxed read still sees the lock held, so the
     * cache line is only written when a claim can succeed.
     */
    [[nodiscard]] SpinGuard<T> lock() noexcept
    {
        AXIOM_ASSERT(_owner.load(std::memory_order_relaxed) != detail::threadTag());

        BackOff backOff;
        while (_flag.test_and_set(std::memory_order_acquire))
        {
            do
            {
                backOff.wait();
            } while (_flag.test(std::memory_order_relaxed));
        }

        return acquired();
    }

    /**
     * @brief Attempts a single claim without spinning.
     * @return A guard if the lock was free, an empty optional otherwise.
     */
    [[nodiscard]] std::optional<SpinGuard<T>> tryLock() noexcept
    {
        if (_flag.test_and_set(std::memory_order_acquire))
        {
            return std::nullopt;
        }
        return acquired();
    }

    /**
     * @brief Attempts up to @p spins claims, backing off between them.
     *
     * The first attempt is immediate; each later one is preceded by a
     * BackOff::wait. @p spins of 0 or 1 is a single @ref tryLock.
     *
     * @param spins Maximum number of claim attempts.
     * @return A guard on success, an empty optional once attempts run out.
     */
    [[nodiscard]] std::optional<SpinGuard<T>> tryLockFor(core::usize spins) noexcept
    {
        BackOff backOff;
        for (core::usize attempt = 1;; ++attempt)
        {
            if (auto guard = tryLock())
            {
                return guard;
            }
            if (attempt >= spins)
            {
                return std::nullopt;
            }
            backOff.wait();
        }
    }

    /**
     * @brief Runs @p fn with exclusive access to the value.
     *
     * The lock is released before this returns, including when @p fn
     * throws. @p fn must return by value: a reference into the value would
     * outlive the lock.
     *
     * @return Whatever @p fn returns.
     */
    template <typename F>
        requires std::is_invocable_v<F, T &>
              && (!std::is_reference_v<std::invoke_result_t<F, T &>>)
    std::invoke_result_t<F, T &> withLock(F &&fn) noexcept(std::is_nothrow_invocable_v<F, T &>)
    {
        SpinGuard<T> guard = lock();
        return std::invoke(std::forward<F>(fn), *guard);
    }

    /**
     * @brief Snapshot of the flag.
     *
     * Stale as soon as it returns; do not use it to decide whether to lock.
     */
    [[nodiscard]] bool isLocked() const noexcept
    {
        return _flag.test(std::memory_order_acquire);
    }

#ifdef AXIOM_DEBUG
    /** @brief Debug only: whether the calling thread is the recorded holder. */
    [[nodiscard]] bool isHeldByCurrentThread() const noexcept
    {
        return _owner.load(std::memory_order_relaxed) == detail::threadTag();
    }
#endif

    /**
     * @brief Releases the lock without going through a guard.
     *
     * @pre The calling thread holds the lock and no live guard will release
     *      it again (see SpinGuard::release()). Breaking this is undefined
     *      behaviour; it is not checked.
     */
    void unlockUnchecked() noexcept
    {
#ifdef AXIOM_DEBUG
        _owner.store(nullptr, std::memory_order_relaxed);
#endif
        _flag.clear(std::memory_order_release);
    }

private:
    friend class SpinGuard<T>;

    SpinGuard<T> acquired() noexcept
    {
#ifdef AXIOM_DEBUG
        _owner.store(detail::threadTag(), std::memory_order_relaxed);
#endif
        return SpinGuard<T>{*this};
    }

    std::atomic_flag _flag; // clear on construction
#ifdef AXIOM_DEBUG
    std::atomic<const void *> _owner{nullptr};
#endif
    T _value;
};

} // namespace axiom::concurrency

#endif // AXIOM_CONCURRENCY_SPINLOCK_HPP
