#pragma once

#include <common/extent.hpp>
#include <common/logger.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace gtb
{
inline constexpr std::uint32_t defaultWindowWidth = 800;
inline constexpr std::uint32_t defaultWindowHeight = 600;

struct AppConfig
{
    Extent2u    windowSize = Extent2u{defaultWindowWidth, defaultWindowHeight};
    std::string title = "gfx-toybox";
    LogLevel    logLevel = LogLevel::Info;
    bool        reportAdapters = true;
};

// Parses the command line. `logEnv` is the value of the GTB_LOG environment variable, or nullptr
// when unset; `--log-level` takes precedence over it.
//
// Returns std::nullopt when help was requested. Throws std::invalid_argument for unknown options,
// missing or malformed values, and window sizes with a zero dimension.
std::optional<AppConfig> parseCommandLine(int argc, const char* const* argv, const char* logEnv);

void printHelp();
} // namespace gtb
