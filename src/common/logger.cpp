#include "logger.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <string>

namespace gtb
{
namespace
{
struct LoggerState
{
    LogLevel                              maxLevel = LogLevel::Info;
    bool                                  initialized = false;
    LogSink                               sink;
    std::chrono::steady_clock::time_point startTime = std::chrono::steady_clock::now();
};

LoggerState& loggerState()
{
    static LoggerState state;
    return state;
}

void stderrSink(const LogLevel level, const std::string_view message)
{
    const auto  elapsed = std::chrono::steady_clock::now() - loggerState().startTime;
    const float seconds = std::chrono::duration<float>(elapsed).count();
    fmt::print(stderr, "[{:>9.3f} {:<5}] {}\n", seconds, logLevelToStr(level), message);
}
} // namespace

std::optional<LogLevel> parseLogLevel(const std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    constexpr std::array<LogLevel, 6> levels{
        LogLevel::Off,
        LogLevel::Error,
        LogLevel::Warn,
        LogLevel::Info,
        LogLevel::Debug,
        LogLevel::Trace,
    };
    for (const LogLevel level : levels)
    {
        std::string levelName = logLevelToStr(level);
        std::transform(
            levelName.begin(), levelName.end(), levelName.begin(), [](const unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
        if (lowered == levelName)
        {
            return level;
        }
    }

    return std::nullopt;
}

const char* logLevelToStr(const LogLevel level)
{
    switch (level)
    {
    case LogLevel::Off:
        return "OFF";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Trace:
        return "TRACE";
    default:
        assert(!"Unknown LogLevel");
        return nullptr;
    }
}

bool initLogger(const LogLevel maxLevel)
{
    LoggerState& state = loggerState();
    if (state.initialized)
    {
        return false;
    }

    state.maxLevel = maxLevel;
    state.initialized = true;
    state.startTime = std::chrono::steady_clock::now();

    return true;
}

LogLevel maxLogLevel() noexcept { return loggerState().maxLevel; }

bool logEnabled(const LogLevel level) noexcept
{
    return level != LogLevel::Off && level <= loggerState().maxLevel;
}

void setLogSink(LogSink sink) { loggerState().sink = std::move(sink); }

namespace detail
{
void writeLog(const LogLevel level, const std::string_view message)
{
    const LoggerState& state = loggerState();
    if (state.sink)
    {
        state.sink(level, message);
    }
    else
    {
        stderrSink(level, message);
    }
}
} // namespace detail
} // namespace gtb
