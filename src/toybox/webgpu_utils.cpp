#include "webgpu_utils.hpp"

#include <common/logger.hpp>
#include <common/platform.hpp>

#include <cassert>

namespace gtb
{
const char* WGPUBackendTypeToStr(const WGPUBackendType type)
{
    switch (type)
    {
    case WGPUBackendType_Undefined:
        return "Undefined";
    case WGPUBackendType_Null:
        return "Null";
    case WGPUBackendType_WebGPU:
        return "WebGPU";
    case WGPUBackendType_D3D11:
        return "D3D11";
    case WGPUBackendType_D3D12:
        return "D3D12";
    case WGPUBackendType_Metal:
        return "Metal";
    case WGPUBackendType_Vulkan:
        return "Vulkan";
    case WGPUBackendType_OpenGL:
        return "OpenGL";
    case WGPUBackendType_OpenGLES:
        return "OpenGLES";
    default:
        return "Other";
    }
}

const char* WGPUAdapterTypeToStr(const WGPUAdapterType type)
{
    switch (type)
    {
    case WGPUAdapterType_DiscreteGPU:
        return "DiscreteGPU";
    case WGPUAdapterType_IntegratedGPU:
        return "IntegratedGPU";
    case WGPUAdapterType_CPU:
        return "CPU";
    case WGPUAdapterType_Unknown:
    default:
        return "Unknown";
    }
}

const char* WGPUTextureFormatToStr(const WGPUTextureFormat format)
{
    // Only the formats a surface typically reports are named.
    switch (format)
    {
    case WGPUTextureFormat_Undefined:
        return "Undefined";
    case WGPUTextureFormat_RGBA8Unorm:
        return "RGBA8Unorm";
    case WGPUTextureFormat_RGBA8UnormSrgb:
        return "RGBA8UnormSrgb";
    case WGPUTextureFormat_BGRA8Unorm:
        return "BGRA8Unorm";
    case WGPUTextureFormat_BGRA8UnormSrgb:
        return "BGRA8UnormSrgb";
    case WGPUTextureFormat_RGB10A2Unorm:
        return "RGB10A2Unorm";
    case WGPUTextureFormat_RGBA16Float:
        return "RGBA16Float";
    default:
        return "Other";
    }
}

const char* WGPUPresentModeToStr(const WGPUPresentMode mode)
{
    switch (mode)
    {
    case WGPUPresentMode_Fifo:
        return "Fifo";
    case WGPUPresentMode_Immediate:
        return "Immediate";
    case WGPUPresentMode_Mailbox:
        return "Mailbox";
    default:
        return "Other";
    }
}

const char* WGPUCompositeAlphaModeToStr(const WGPUCompositeAlphaMode mode)
{
    switch (mode)
    {
    case WGPUCompositeAlphaMode_Auto:
        return "Auto";
    case WGPUCompositeAlphaMode_Opaque:
        return "Opaque";
    case WGPUCompositeAlphaMode_Premultiplied:
        return "Premultiplied";
    case WGPUCompositeAlphaMode_Unpremultiplied:
        return "Unpremultiplied";
    case WGPUCompositeAlphaMode_Inherit:
        return "Inherit";
    default:
        return "Other";
    }
}

const char* WGPUErrorTypeToStr(const WGPUErrorType type)
{
    switch (type)
    {
    case WGPUErrorType_NoError:
        return "NoError";
    case WGPUErrorType_Validation:
        return "Validation";
    case WGPUErrorType_OutOfMemory:
        return "OutOfMemory";
    case WGPUErrorType_Internal:
        return "Internal";
    case WGPUErrorType_Unknown:
        return "Unknown";
    case WGPUErrorType_DeviceLost:
        return "DeviceLost";
    default:
        assert(!"Unknown WGPUErrorType");
        return "Unknown";
    }
}

const char* WGPUDeviceLostReasonToStr(const WGPUDeviceLostReason reason)
{
    switch (reason)
    {
    case WGPUDeviceLostReason_Undefined:
        return "Undefined";
    case WGPUDeviceLostReason_Destroyed:
        return "Destroyed";
    default:
        return "Other";
    }
}

WGPUBackendType primaryBackendType() noexcept
{
#if GTB_PLATFORM == GTB_WINDOWS
    return WGPUBackendType_D3D12;
#elif GTB_PLATFORM == GTB_MACOS
    return WGPUBackendType_Metal;
#elif GTB_PLATFORM == GTB_LINUX
    return WGPUBackendType_Vulkan;
#else
    return WGPUBackendType_Undefined;
#endif
}

WGPUAdapter requestAdapter(const WGPUInstance instance, const WGPURequestAdapterOptions& options)
{
    struct AdapterResponse
    {
        WGPUAdapter adapter = nullptr;
        bool        done = false;
    };
    AdapterResponse response;

    auto onAdapterResponse = [](WGPURequestAdapterStatus status,
                                WGPUAdapter              adapter,
                                char const*              message,
                                void*                    userData) {
        AdapterResponse* response = reinterpret_cast<AdapterResponse*>(userData);
        if (status == WGPURequestAdapterStatus_Success)
        {
            response->adapter = adapter;
        }
        else
        {
            logDebug("Adapter request failed: {}", message ? message : "no message");
        }
        response->done = true;
    };

    wgpuInstanceRequestAdapter(instance, &options, onAdapterResponse, &response);

    // Dawn may answer from inside the request call. Otherwise the callback fires while processing
    // instance events.
    while (!response.done)
    {
        wgpuInstanceProcessEvents(instance);
    }

    return response.adapter;
}

WGPUDevice requestDevice(
    const WGPUInstance          instance,
    const WGPUAdapter           adapter,
    const WGPUDeviceDescriptor& deviceDesc)
{
    struct DeviceResponse
    {
        WGPUDevice device = nullptr;
        bool       done = false;
    };
    DeviceResponse response;

    auto onDeviceResponse = [](WGPURequestDeviceStatus status,
                               WGPUDevice              maybeDevice,
                               char const* const       message,
                               void*                   userData) -> void {
        DeviceResponse* response = reinterpret_cast<DeviceResponse*>(userData);
        if (status == WGPURequestDeviceStatus_Success)
        {
            response->device = maybeDevice;
        }
        else
        {
            logError("Failed to request device: {}", message ? message : "no message");
        }
        response->done = true;
    };

    wgpuAdapterRequestDevice(adapter, &deviceDesc, onDeviceResponse, &response);

    while (!response.done)
    {
        wgpuInstanceProcessEvents(instance);
    }

    return response.device;
}
} // namespace gtb
