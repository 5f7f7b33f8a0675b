/**
 * @file TestStressConfig.cpp
 * @brief Unit tests for the stress harness argument parsing.
 */

#include <catch2/catch.hpp>

#include "StressConfig.hpp"

#include <string_view>
#include <vector>

namespace axiom::stress {

namespace {

core::Expected<StressConfig> parse(std::vector<std::string_view> args)
{
    return parseArgs(args);
}

} // namespace

TEST_CASE("parseArgs applies defaults", "[stress][config]")
{
    const auto config = parse({});

    REQUIRE(config.has_value());
    REQUIRE(config->threads() == StressConfig::kDefaultThreads);
    REQUIRE(config->iterations() == StressConfig::kDefaultIterations);
    REQUIRE(config->mode() == StressMode::kLock);
    REQUIRE(config->tryLockSpins() == StressConfig::kDefaultTryLockSpins);
    REQUIRE_FALSE(config->showHelp());
}

TEST_CASE("parseArgs reads every flag", "[stress][config]")
{
    const auto config = parse({"--threads", "8", "--iterations", "50000", "--mode", "try", "--spins", "16"});

    REQUIRE(config.has_value());
    REQUIRE(config->threads() == 8);
    REQUIRE(config->iterations() == 50'000);
    REQUIRE(config->mode() == StressMode::kTryLock);
    REQUIRE(config->tryLockSpins() == 16);
    REQUIRE(config->expectedTotal() == 400'000);
}

TEST_CASE("parseArgs recognises help", "[stress][config]")
{
    const auto config = parse({"--help"});
    REQUIRE(config.has_value());
    REQUIRE(config->showHelp());
}

TEST_CASE("parseArgs rejects malformed input", "[stress][config]")
{
    SECTION("unknown flag")
    {
        const auto config = parse({"--fast"});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("missing value")
    {
        const auto config = parse({"--threads"});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kMissingArgument);
    }

    SECTION("non-numeric value")
    {
        const auto config = parse({"--iterations", "12abc"});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("negative value")
    {
        const auto config = parse({"--threads", "-4"});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("zero threads")
    {
        const auto config = parse({"--threads", "0"});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kOutOfRange);
    }

    SECTION("unknown mode")
    {
        const auto config = parse({"--mode", "fair"});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("total overflows the counter")
    {
        const auto config = parse({"--threads", "4", "--iterations", "18446744073709551615"});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kOutOfRange);
    }
}

TEST_CASE("StressMode names round-trip through parseMode", "[stress][config]")
{
    for (const StressMode mode : {StressMode::kLock, StressMode::kTryLock, StressMode::kWithLock})
    {
        const auto parsed = parseMode(toString(mode));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == mode);
    }
}

} // namespace axiom::stress
