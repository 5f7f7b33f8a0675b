// /////////////////////////////////////////////////////////////////////////////
/// @file StressConfig.cpp
/// @brief StressConfig::Builder implementation and command-line parsing.
// /////////////////////////////////////////////////////////////////////////////

#include "StressConfig.hpp"

#include <axiom/core/Assert.hpp>

#include <charconv>
#include <format>
#include <limits>
#include <string>

namespace axiom::stress {

namespace {

constexpr core::u64 kMaxTotalIncrements = static_cast<core::u64>(std::numeric_limits<core::i64>::max());

template <typename Int>
core::Expected<Int> parseNumber(std::string_view flag, std::string_view text)
{
    Int value{};
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range)
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               std::format("{}: '{}' is too large", flag, text));
    }
    if (ec != std::errc{} || end != text.data() + text.size())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("{}: '{}' is not a number", flag, text));
    }
    return value;
}

} // namespace

// -------------------------------------------------------------------------- //
//  Mode                                                                      //
// -------------------------------------------------------------------------- //

std::string_view toString(StressMode mode) noexcept
{
    switch (mode)
    {
        case StressMode::kLock:     return "lock";
        case StressMode::kTryLock:  return "try";
        case StressMode::kWithLock: return "with";
    }
    AXIOM_UNREACHABLE();
}

core::Expected<StressMode> parseMode(std::string_view text)
{
    if (text == "lock") return StressMode::kLock;
    if (text == "try")  return StressMode::kTryLock;
    if (text == "with") return StressMode::kWithLock;

    return core::makeError(core::ErrorCode::kInvalidArgument,
                           std::format("--mode: unknown mode '{}'", text));
}

// -------------------------------------------------------------------------- //
//  Builder                                                                   //
// -------------------------------------------------------------------------- //

StressConfig::Builder& StressConfig::Builder::threads(core::u32 n) noexcept
{
    threads_ = n;
    return *this;
}

StressConfig::Builder& StressConfig::Builder::iterations(core::u64 n) noexcept
{
    iterations_ = n;
    return *this;
}

StressConfig::Builder& StressConfig::Builder::mode(StressMode m) noexcept
{
    mode_ = m;
    return *this;
}

StressConfig::Builder& StressConfig::Builder::tryLockSpins(core::u32 n) noexcept
{
    tryLockSpins_ = n;
    return *this;
}

StressConfig::Builder& StressConfig::Builder::showHelp(bool enabled) noexcept
{
    showHelp_ = enabled;
    return *this;
}

core::Expected<StressConfig> StressConfig::Builder::build() const
{
    if (threads_ == 0)
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "--threads must be at least 1");
    }
    if (iterations_ > kMaxTotalIncrements / threads_)
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               "--threads x --iterations overflows the 64-bit counter");
    }

    StressConfig cfg;
    cfg.threads_      = threads_;
    cfg.iterations_   = iterations_;
    cfg.mode_         = mode_;
    cfg.tryLockSpins_ = tryLockSpins_;
    cfg.showHelp_     = showHelp_;
    return cfg;
}

// -------------------------------------------------------------------------- //
//  Command line                                                              //
// -------------------------------------------------------------------------- //

core::Expected<StressConfig> parseArgs(std::span<const std::string_view> args)
{
    StressConfig::Builder builder;

    for (core::usize i = 0; i < args.size(); ++i)
    {
        const std::string_view flag = args[i];

        if (flag == "--help" || flag == "-h")
        {
            builder.showHelp(true);
            continue;
        }

        if (flag != "--threads" && flag != "--iterations" && flag != "--mode" && flag != "--spins")
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::format("unknown argument '{}'", flag));
        }
        if (i + 1 >= args.size())
        {
            return core::makeError(core::ErrorCode::kMissingArgument,
                                   std::format("{} expects a value", flag));
        }
        const std::string_view value = args[++i];

        if (flag == "--threads")
        {
            builder.threads(AXIOM_TRY(parseNumber<core::u32>(flag, value)));
        }
        else if (flag == "--iterations")
        {
            builder.iterations(AXIOM_TRY(parseNumber<core::u64>(flag, value)));
        }
        else if (flag == "--spins")
        {
            builder.tryLockSpins(AXIOM_TRY(parseNumber<core::u32>(flag, value)));
        }
        else
        {
            builder.mode(AXIOM_TRY(parseMode(value)));
        }
    }

    return builder.build();
}

std::string_view usage() noexcept
{
    return "usage: axiom_stress [--threads N] [--iterations M] [--mode lock|try|with] "
           "[--spins S] [--help]\n"
           "  Spawns N threads that each increment a shared SpinLock-protected counter\n"
           "  M times and checks that the final value is exactly N x M.";
}

} // namespace axiom::stress
