#pragma once

#include <fmt/core.h>

#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace gtb
{
enum class LogLevel
{
    Off,
    Error,
    Warn,
    Info,
    Debug,
    Trace,
};

using LogSink = std::function<void(LogLevel, std::string_view)>;

// Accepts the level names "off", "error", "warn", "info", "debug" and "trace", in any case.
std::optional<LogLevel> parseLogLevel(std::string_view name);
const char*             logLevelToStr(LogLevel level);

// Sets the process-wide level filter. Only the first call has an effect; subsequent calls return
// false.
bool     initLogger(LogLevel maxLevel);
LogLevel maxLogLevel() noexcept;
bool     logEnabled(LogLevel level) noexcept;

// Replaces the output sink. Passing an empty function restores the default stderr sink.
void setLogSink(LogSink sink);

namespace detail
{
void writeLog(LogLevel level, std::string_view message);

template<typename... Args>
void log(const LogLevel level, fmt::format_string<Args...> format, Args&&... args)
{
    if (logEnabled(level))
    {
        writeLog(level, fmt::format(format, std::forward<Args>(args)...));
    }
}
} // namespace detail

template<typename... Args>
void logError(fmt::format_string<Args...> format, Args&&... args)
{
    detail::log(LogLevel::Error, format, std::forward<Args>(args)...);
}

template<typename... Args>
void logWarn(fmt::format_string<Args...> format, Args&&... args)
{
    detail::log(LogLevel::Warn, format, std::forward<Args>(args)...);
}

template<typename... Args>
void logInfo(fmt::format_string<Args...> format, Args&&... args)
{
    detail::log(LogLevel::Info, format, std::forward<Args>(args)...);
}

template<typename... Args>
void logDebug(fmt::format_string<Args...> format, Args&&... args)
{
    detail::log(LogLevel::Debug, format, std::forward<Args>(args)...);
}

template<typename... Args>
void logTrace(fmt::format_string<Args...> format, Args&&... args)
{
    detail::log(LogLevel::Trace, format, std::forward<Args>(args)...);
}
} // namespace gtb
