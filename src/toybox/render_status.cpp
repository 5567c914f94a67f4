#include "render_status.hpp"

#include <fmt/core.h>

#include <cassert>
#include <stdexcept>

namespace gtb
{
RenderStatus toRenderStatus(const WGPUSurfaceGetCurrentTextureStatus status)
{
    switch (status)
    {
    case WGPUSurfaceGetCurrentTextureStatus_Success:
        return RenderStatus::Success;
    case WGPUSurfaceGetCurrentTextureStatus_Timeout:
        return RenderStatus::Timeout;
    case WGPUSurfaceGetCurrentTextureStatus_Outdated:
        return RenderStatus::Outdated;
    case WGPUSurfaceGetCurrentTextureStatus_Lost:
        return RenderStatus::Lost;
    case WGPUSurfaceGetCurrentTextureStatus_OutOfMemory:
        return RenderStatus::OutOfMemory;
    case WGPUSurfaceGetCurrentTextureStatus_DeviceLost:
        return RenderStatus::DeviceLost;
    default:
        throw std::runtime_error(fmt::format(
            "Unhandled surface texture status {:#x}.", static_cast<unsigned int>(status)));
    }
}

const char* renderStatusToStr(const RenderStatus status)
{
    switch (status)
    {
    case RenderStatus::Success:
        return "Success";
    case RenderStatus::Lost:
        return "Lost";
    case RenderStatus::Outdated:
        return "Outdated";
    case RenderStatus::Timeout:
        return "Timeout";
    case RenderStatus::OutOfMemory:
        return "OutOfMemory";
    case RenderStatus::DeviceLost:
        return "DeviceLost";
    default:
        assert(!"Unknown RenderStatus");
        return "Unknown";
    }
}
} // namespace gtb
