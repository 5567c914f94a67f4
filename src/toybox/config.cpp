#include "config.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdio>
#include <stdexcept>
#include <string_view>

namespace gtb
{
namespace
{
LogLevel logLevelArg(const std::string_view option, const std::string_view value)
{
    const std::optional<LogLevel> level = parseLogLevel(value);
    if (!level)
    {
        throw std::invalid_argument(fmt::format("Invalid log level \"{}\" for {}.", value, option));
    }
    return *level;
}

std::uint32_t dimensionArg(const std::string_view option, const std::string_view value)
{
    std::uint32_t result = 0;
    const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || end != value.data() + value.size() || result == 0)
    {
        throw std::invalid_argument(
            fmt::format("Expected a positive integer for {}, got \"{}\".", option, value));
    }
    return result;
}
} // namespace

std::optional<AppConfig> parseCommandLine(
    const int                argc,
    const char* const* const argv,
    const char* const        logEnv)
{
    AppConfig config;

    if (logEnv != nullptr && *logEnv != '\0')
    {
        config.logLevel = logLevelArg("GTB_LOG", logEnv);
    }

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h")
        {
            return std::nullopt;
        }

        if (arg == "--no-adapter-report")
        {
            config.reportAdapters = false;
            continue;
        }

        const bool takesValue =
            arg == "--width" || arg == "--height" || arg == "--title" || arg == "--log-level";
        if (!takesValue)
        {
            throw std::invalid_argument(fmt::format("Unknown option \"{}\".", arg));
        }

        if (i + 1 >= argc)
        {
            throw std::invalid_argument(fmt::format("Missing value for {}.", arg));
        }
        const std::string_view value = argv[++i];

        if (arg == "--width")
        {
            config.windowSize.width = dimensionArg(arg, value);
        }
        else if (arg == "--height")
        {
            config.windowSize.height = dimensionArg(arg, value);
        }
        else if (arg == "--title")
        {
            config.title = value;
        }
        else
        {
            config.logLevel = logLevelArg(arg, value);
        }
    }

    return config;
}

void printHelp()
{
    std::printf(
        "Usage:\n"
        "\ttoybox [options]\n"
        "\n"
        "Options:\n"
        "\t--width <pixels>         initial window width (default %u)\n"
        "\t--height <pixels>        initial window height (default %u)\n"
        "\t--title <text>           window title\n"
        "\t--log-level <level>      off, error, warn, info, debug or trace (default info)\n"
        "\t--no-adapter-report      skip listing the GPU adapters at startup\n"
        "\t-h, --help               print this message\n"
        "\n"
        "The GTB_LOG environment variable sets the log level when --log-level is not given.\n",
        static_cast<unsigned int>(defaultWindowWidth),
        static_cast<unsigned int>(defaultWindowHeight));
}
} // namespace gtb
