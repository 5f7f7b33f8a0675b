/**
 * @file Log.cpp
 * @brief Default ILogger implementation writing to stderr.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "axiom/core/Log.hpp"

#include <atomic>
#include <cstdio>

namespace axiom::core {

namespace {

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        static constexpr const char *kLevelNames[] = {
            "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"
        };
        const auto idx = static_cast<unsigned>(level);
        std::fprintf(
            stderr,
            "[%s][%.*s] %.*s\n",
            kLevelNames[idx],
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }
};

StderrLogger           gDefaultLogger;
std::atomic<ILogger *> gActiveLogger{&gDefaultLogger};
std::atomic<LogLevel>  gMinLevel{LogLevel::kInfo};

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel.load(std::memory_order_relaxed))
        return;
    gActiveLogger.load(std::memory_order_acquire)->write(level, tag, msg);
}

} // anonymous namespace

void Log::setLogger(ILogger *logger)
{
    gActiveLogger.store(logger ? logger : &gDefaultLogger, std::memory_order_release);
}

void Log::setMinLevel(LogLevel level) { gMinLevel.store(level, std::memory_order_relaxed); }
LogLevel Log::minLevel()              { return gMinLevel.load(std::memory_order_relaxed); }

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

} // namespace axiom::core
