#include "adapter_report.hpp"
#include "graphics_context.hpp"
#include "webgpu_utils.hpp"
#include "window.hpp"

#include <common/assert.hpp>
#include <common/logger.hpp>

#include <glfw3webgpu.h>

#include <stdexcept>

namespace gtb
{
namespace
{
void onDeviceLost(WGPUDeviceLostReason reason, const char* const message, void* /*userdata*/)
{
    // Releasing the device at shutdown reports it as lost, too.
    if (reason == WGPUDeviceLostReason_Destroyed)
    {
        logDebug("Device destroyed");
        return;
    }

    logError(
        "Device lost reason: {}: {}",
        WGPUDeviceLostReasonToStr(reason),
        message ? message : "no message");
}

void onDeviceError(WGPUErrorType type, const char* message, void* /*userdata*/)
{
    logError(
        "Uncaptured device error: {}: {}",
        WGPUErrorTypeToStr(type),
        message ? message : "no message");
}

SurfaceCapabilities getSurfaceCapabilities(const WGPUSurface surface, const WGPUAdapter adapter)
{
    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(surface, adapter, &capabilities);

    SurfaceCapabilities result{
        .formats = {capabilities.formats, capabilities.formats + capabilities.formatCount},
        .presentModes =
            {capabilities.presentModes,
             capabilities.presentModes + capabilities.presentModeCount},
        .alphaModes =
            {capabilities.alphaModes, capabilities.alphaModes + capabilities.alphaModeCount},
    };

    wgpuSurfaceCapabilitiesFreeMembers(capabilities);

    return result;
}
} // namespace

WGPURenderPassColorAttachment clearColorAttachment(const WGPUTextureView view) noexcept
{
    return WGPURenderPassColorAttachment{
        .nextInChain = nullptr,
        .view = view,
        .depthSlice = WGPU_DEPTH_SLICE_UNDEFINED, // depthSlice must be initialized with
                                                  // 'undefined' value for 2d color attachments.
        .resolveTarget = nullptr,
        .loadOp = WGPULoadOp_Clear,
        .storeOp = WGPUStoreOp_Store,
        .clearValue = CLEAR_COLOR,
    };
}

GraphicsContext::GraphicsContext(const Window& window)
    : mInstance(nullptr),
      mSurface(nullptr),
      mDevice(nullptr),
      mQueue(nullptr),
      mConfig(),
      mSize(window.resolution()),
      mSurfaceConfigured(false)
{
    GTB_ASSERT(window.ptr() != nullptr);

    mInstance = []() -> WGPUInstance {
        const WGPUInstanceDescriptor instanceDesc{
            .nextInChain = nullptr,
        };
        return wgpuCreateInstance(&instanceDesc);
    }();

    if (!mInstance)
    {
        throw std::runtime_error("Failed to create WGPUInstance instance.");
    }

    // glfw3webgpu hides the platform-specific surface descriptor chains.
    mSurface = glfwGetWGPUSurface(mInstance, window.ptr());
    if (!mSurface)
    {
        release();
        throw std::runtime_error("Failed to create WGPUSurface instance.");
    }

    const WGPUAdapter adapter = [this]() -> WGPUAdapter {
        WGPURequestAdapterOptions adapterOptions = {};
        adapterOptions.compatibleSurface = mSurface;
        adapterOptions.powerPreference = WGPUPowerPreference_Undefined;
        adapterOptions.backendType = primaryBackendType();
        // Hardware adapters only.
        adapterOptions.forceFallbackAdapter = false;
        return requestAdapter(mInstance, adapterOptions);
    }();

    if (!adapter)
    {
        release();
        throw std::runtime_error("Failed to create WGPUAdapter instance.");
    }

    logInfo("Using adapter {}", formatAdapterInfo(getAdapterInfo(adapter)));

    mDevice = [this, adapter]() -> WGPUDevice {
        const WGPUDeviceDescriptor deviceDesc{
            .nextInChain = nullptr,
            .label = "Device",
            .requiredFeatureCount = 0,
            .requiredFeatures = nullptr,
            .requiredLimits = nullptr,
            .defaultQueue = WGPUQueueDescriptor{.nextInChain = nullptr, .label = "Default queue"},
            .deviceLostCallback = onDeviceLost,
            .deviceLostUserdata = nullptr,
        };
        return requestDevice(mInstance, adapter, deviceDesc);
    }();

    if (!mDevice)
    {
        adapterSafeRelease(adapter);
        release();
        throw std::runtime_error("Failed to create WGPUDevice instance.");
    }

    wgpuDeviceSetUncapturedErrorCallback(mDevice, onDeviceError, nullptr);
    mQueue = wgpuDeviceGetQueue(mDevice);

    try
    {
        const SurfaceCapabilities capabilities = getSurfaceCapabilities(mSurface, adapter);
        mConfig = selectSurfaceConfig(capabilities, mSize);
    }
    catch (const std::invalid_argument& e)
    {
        adapterSafeRelease(adapter);
        release();
        throw std::runtime_error(e.what());
    }

    adapterSafeRelease(adapter);

    logInfo(
        "Surface format {}, present mode {}, alpha mode {}, max frame latency {}",
        WGPUTextureFormatToStr(mConfig.format),
        WGPUPresentModeToStr(mConfig.presentMode),
        WGPUCompositeAlphaModeToStr(mConfig.alphaMode),
        mConfig.maxFrameLatency);

    if (hasZeroArea(mSize))
    {
        logDebug("Window has zero area, deferring surface configuration");
        return;
    }

    configureSurface();
}

GraphicsContext::~GraphicsContext() { release(); }

bool GraphicsContext::input(const WindowEvent& /*event*/) { return false; }

void GraphicsContext::resize(const Extent2u newSize)
{
    if (!resizeSurfaceConfig(mConfig, newSize))
    {
        logTrace("Ignoring resize to {}x{}", newSize.width, newSize.height);
        return;
    }

    mSize = newSize;
    configureSurface();
}

void GraphicsContext::update() {}

RenderStatus GraphicsContext::render()
{
    if (!mSurfaceConfigured)
    {
        return RenderStatus::Outdated;
    }

    // Non-standard Dawn way to ensure that Dawn ticks pending async operations.
    wgpuDeviceTick(mDevice);

    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(mSurface, &surfaceTexture);

    const RenderStatus status = toRenderStatus(surfaceTexture.status);
    if (status != RenderStatus::Success)
    {
        textureSafeRelease(surfaceTexture.texture);
        return status;
    }

    GTB_ASSERT(surfaceTexture.texture != nullptr);

    const WGPUTextureView view = wgpuTextureCreateView(surfaceTexture.texture, nullptr);
    GTB_ASSERT(view != nullptr);

    const WGPUCommandEncoder encoder = [this]() {
        const WGPUCommandEncoderDescriptor cmdEncoderDesc{
            .nextInChain = nullptr,
            .label = "Render encoder",
        };
        return wgpuDeviceCreateCommandEncoder(mDevice, &cmdEncoderDesc);
    }();

    {
        const WGPURenderPassColorAttachment colorAttachment = clearColorAttachment(view);

        const WGPURenderPassDescriptor renderPassDesc = {
            .nextInChain = nullptr,
            .label = "Render pass",
            .colorAttachmentCount = 1,
            .colorAttachments = &colorAttachment,
            .depthStencilAttachment = nullptr,
            .occlusionQuerySet = nullptr,
            .timestampWrites = nullptr,
        };

        const WGPURenderPassEncoder renderPassEncoder =
            wgpuCommandEncoderBeginRenderPass(encoder, &renderPassDesc);
        wgpuRenderPassEncoderEnd(renderPassEncoder);
        renderPassEncoderSafeRelease(renderPassEncoder);
    }

    const WGPUCommandBuffer cmdBuffer = [encoder]() {
        const WGPUCommandBufferDescriptor cmdBufferDesc{
            .nextInChain = nullptr,
            .label = "Render command buffer",
        };
        return wgpuCommandEncoderFinish(encoder, &cmdBufferDesc);
    }();
    wgpuQueueSubmit(mQueue, 1, &cmdBuffer);

    wgpuSurfacePresent(mSurface);

    commandBufferSafeRelease(cmdBuffer);
    commandEncoderSafeRelease(encoder);
    textureViewSafeRelease(view);
    textureSafeRelease(surfaceTexture.texture);

    return RenderStatus::Success;
}

void GraphicsContext::configureSurface()
{
    GTB_ASSERT(!hasZeroArea(surfaceSize(mConfig)));

    const WGPUSurfaceConfiguration surfaceConfig{
        .nextInChain = nullptr,
        .device = mDevice,
        .format = mConfig.format,
        .usage = WGPUTextureUsage_RenderAttachment,
        .viewFormatCount = 0,
        .viewFormats = nullptr,
        .alphaMode = mConfig.alphaMode,
        .width = mConfig.width,
        .height = mConfig.height,
        .presentMode = mConfig.presentMode,
    };
    wgpuSurfaceConfigure(mSurface, &surfaceConfig);
    mSurfaceConfigured = true;

    logDebug("Configured surface {}x{}", mConfig.width, mConfig.height);
}

void GraphicsContext::release() noexcept
{
    if (mSurface && mSurfaceConfigured)
    {
        wgpuSurfaceUnconfigure(mSurface);
        mSurfaceConfigured = false;
    }
    surfaceSafeRelease(mSurface);
    mSurface = nullptr;
    queueSafeRelease(mQueue);
    mQueue = nullptr;
    deviceSafeRelease(mDevice);
    mDevice = nullptr;
    instanceSafeRelease(mInstance);
    mInstance = nullptr;
}
} // namespace gtb
