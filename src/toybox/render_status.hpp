#pragma once

#include <webgpu/webgpu.h>

namespace gtb
{
// The outcome of rendering one frame. Everything except Success means the frame was not presented.
enum class RenderStatus
{
    Success,
    // The surface must be reconfigured before the next frame can be acquired.
    Lost,
    Outdated,
    // Acquiring the frame took too long. The next frame may succeed.
    Timeout,
    OutOfMemory,
    DeviceLost,
};

// Throws std::runtime_error for status values without a RenderStatus counterpart.
RenderStatus toRenderStatus(WGPUSurfaceGetCurrentTextureStatus status);

const char* renderStatusToStr(RenderStatus status);
} // namespace gtb
