#pragma once

#include <webgpu/webgpu.h>

namespace gtb
{
inline void instanceSafeRelease(const WGPUInstance instance) noexcept
{
    if (instance)
    {
        wgpuInstanceRelease(instance);
    }
}

inline void surfaceSafeRelease(const WGPUSurface surface) noexcept
{
    if (surface)
    {
        wgpuSurfaceRelease(surface);
    }
}

inline void adapterSafeRelease(const WGPUAdapter adapter) noexcept
{
    if (adapter)
    {
        wgpuAdapterRelease(adapter);
    }
}

inline void deviceSafeRelease(const WGPUDevice device) noexcept
{
    if (device)
    {
        wgpuDeviceRelease(device);
    }
}

inline void queueSafeRelease(const WGPUQueue queue) noexcept
{
    if (queue)
    {
        wgpuQueueRelease(queue);
    }
}

// NOTE: surface textures are owned by the surface. They are released, never destroyed.
inline void textureSafeRelease(const WGPUTexture texture) noexcept
{
    if (texture)
    {
        wgpuTextureRelease(texture);
    }
}

inline void textureViewSafeRelease(const WGPUTextureView textureView) noexcept
{
    if (textureView)
    {
        wgpuTextureViewRelease(textureView);
    }
}

inline void commandEncoderSafeRelease(const WGPUCommandEncoder encoder) noexcept
{
    if (encoder)
    {
        wgpuCommandEncoderRelease(encoder);
    }
}

inline void commandBufferSafeRelease(const WGPUCommandBuffer commandBuffer) noexcept
{
    if (commandBuffer)
    {
        wgpuCommandBufferRelease(commandBuffer);
    }
}

inline void renderPassEncoderSafeRelease(const WGPURenderPassEncoder renderPassEncoder) noexcept
{
    if (renderPassEncoder)
    {
        wgpuRenderPassEncoderRelease(renderPassEncoder);
    }
}

const char* WGPUBackendTypeToStr(WGPUBackendType);
const char* WGPUAdapterTypeToStr(WGPUAdapterType);
const char* WGPUTextureFormatToStr(WGPUTextureFormat);
const char* WGPUPresentModeToStr(WGPUPresentMode);
const char* WGPUCompositeAlphaModeToStr(WGPUCompositeAlphaMode);
const char* WGPUErrorTypeToStr(WGPUErrorType);
const char* WGPUDeviceLostReasonToStr(WGPUDeviceLostReason);

// The backend the host platform presents through natively: D3D12 on Windows, Metal on macOS,
// Vulkan on Linux. On Emscripten the browser decides.
WGPUBackendType primaryBackendType() noexcept;

// Requests an adapter and blocks, processing instance events, until the request has been answered.
// Returns nullptr if no adapter matches the options.
WGPUAdapter requestAdapter(WGPUInstance, const WGPURequestAdapterOptions&);

// Requests a device and blocks until the request has been answered. Returns nullptr on failure.
WGPUDevice requestDevice(WGPUInstance, WGPUAdapter, const WGPUDeviceDescriptor&);
} // namespace gtb
