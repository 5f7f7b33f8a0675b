// /////////////////////////////////////////////////////////////////////////////
/// @file StressConfig.hpp
/// @brief Stress harness configuration (Builder pattern) and argument parsing.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <axiom/core/Expected.hpp>
#include <axiom/core/Types.hpp>

#include <span>
#include <string_view>

namespace axiom::stress {

/// @brief How each worker claims the shared counter.
enum class StressMode : core::u8 {
    kLock,      ///< SpinLock::lock
    kTryLock,   ///< SpinLock::tryLockFor, retried until it succeeds
    kWithLock   ///< SpinLock::withLock
};

[[nodiscard]] std::string_view toString(StressMode mode) noexcept;
[[nodiscard]] core::Expected<StressMode> parseMode(std::string_view text);

/// @brief Immutable stress run configuration.
class StressConfig
{
public:
    static constexpr core::u32 kDefaultThreads     = 100;
    static constexpr core::u64 kDefaultIterations  = 1'000'000;
    static constexpr core::u32 kDefaultTryLockSpins = 64;

    /// @brief Fluent builder for StressConfig.
    class Builder
    {
    public:
        Builder& threads(core::u32 n) noexcept;
        Builder& iterations(core::u64 n) noexcept;
        Builder& mode(StressMode m) noexcept;
        Builder& tryLockSpins(core::u32 n) noexcept;
        Builder& showHelp(bool enabled) noexcept;

        /// @brief Validates and produces the configuration.
        [[nodiscard]] core::Expected<StressConfig> build() const;

    private:
        core::u32  threads_{kDefaultThreads};
        core::u64  iterations_{kDefaultIterations};
        StressMode mode_{StressMode::kLock};
        core::u32  tryLockSpins_{kDefaultTryLockSpins};
        bool       showHelp_{false};
    };

    [[nodiscard]] core::u32  threads()      const noexcept { return threads_; }
    [[nodiscard]] core::u64  iterations()   const noexcept { return iterations_; }
    [[nodiscard]] StressMode mode()         const noexcept { return mode_; }
    [[nodiscard]] core::u32  tryLockSpins() const noexcept { return tryLockSpins_; }
    [[nodiscard]] bool       showHelp()     const noexcept { return showHelp_; }

    /// @brief Total number of increments the run must produce.
    [[nodiscard]] core::u64 expectedTotal() const noexcept
    {
        return static_cast<core::u64>(threads_) * iterations_;
    }

private:
    core::u32  threads_{kDefaultThreads};
    core::u64  iterations_{kDefaultIterations};
    StressMode mode_{StressMode::kLock};
    core::u32  tryLockSpins_{kDefaultTryLockSpins};
    bool       showHelp_{false};
};

/// @brief Parses `--threads N --iterations M --mode lock|try|with --spins S --help`.
/// @param args Command-line arguments without the program name.
[[nodiscard]] core::Expected<StressConfig> parseArgs(std::span<const std::string_view> args);

/// @brief One-paragraph usage text for `--help` and argument errors.
[[nodiscard]] std::string_view usage() noexcept;

} // namespace axiom::stress
