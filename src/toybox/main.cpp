#include "adapter_report.hpp"
#include "config.hpp"
#include "frame_loop.hpp"
#include "graphics_context.hpp"
#include "window.hpp"

#include <common/logger.hpp>

#include <fmt/core.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>

int main(int argc, char** argv)
try
{
    const std::optional<gtb::AppConfig> config =
        gtb::parseCommandLine(argc, argv, std::getenv("GTB_LOG"));
    if (!config)
    {
        gtb::printHelp();
        return 0;
    }

    gtb::initLogger(config->logLevel);

    if (config->reportAdapters)
    {
        gtb::reportAdapters();
    }

    gtb::Window window{gtb::WindowDescriptor{
        .windowSize = config->windowSize,
        .title = config->title,
    }};

    std::optional<gtb::LoopExit> exitReason;

    // The context's surface refers to the window, so it is torn down first.
    {
        gtb::GraphicsContext context{window};

        gtb::FrameLoop<gtb::GraphicsContext> frameLoop{
            context, [&window]() -> void { window.requestRedraw(); }};

        window.run([&frameLoop](const gtb::WindowEvent& event) -> gtb::ControlFlow {
            frameLoop.handleEvent(event);
            return frameLoop.exitRequested() ? gtb::ControlFlow::Exit
                                             : gtb::ControlFlow::Continue;
        });

        exitReason = frameLoop.exitReason();
    }

    return exitReason && gtb::isFatal(*exitReason) ? 1 : 0;
}
catch (const std::exception& e)
{
    fmt::print(stderr, "Exception occurred. {}\n", e.what());
    return 1;
}
catch (...)
{
    fmt::print(stderr, "Unknown exception occurred.\n");
    return 1;
}
