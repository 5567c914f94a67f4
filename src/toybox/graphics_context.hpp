#pragma once

#include "render_status.hpp"
#include "surface_config.hpp"
#include "window_event.hpp"

#include <common/extent.hpp>

#include <webgpu/webgpu.h>

namespace gtb
{
class Window;

inline constexpr WGPUColor CLEAR_COLOR{0.1, 0.2, 0.3, 1.0};

// The color attachment every frame renders into: cleared to CLEAR_COLOR and stored.
WGPURenderPassColorAttachment clearColorAttachment(WGPUTextureView view) noexcept;

// Owns the GPU device, its queue and the window's presentation surface.
//
// The surface refers to resources owned by the window: the window must outlive the context.
class GraphicsContext
{
public:
    // Negotiates an adapter, device and surface configuration for the window. Blocks until the
    // adapter and device requests have been answered. Throws std::runtime_error on failure.
    explicit GraphicsContext(const Window&);
    ~GraphicsContext();

    GraphicsContext(const GraphicsContext&) = delete;
    GraphicsContext& operator=(const GraphicsContext&) = delete;

    GraphicsContext(GraphicsContext&&) = delete;
    GraphicsContext& operator=(GraphicsContext&&) = delete;

    // Frame

    // Returns true if the event was consumed. No events are consumed yet.
    bool input(const WindowEvent&);
    // Reconfigures the surface. Sizes with a zero dimension are ignored.
    void resize(Extent2u newSize);
    void update();
    // Acquires, clears and presents one frame.
    RenderStatus render();

    // Accessors

    // The last size the surface was configured with.
    Extent2u             size() const noexcept { return mSize; }
    const SurfaceConfig& config() const noexcept { return mConfig; }

private:
    void configureSurface();
    void release() noexcept;

    WGPUInstance  mInstance;
    WGPUSurface   mSurface;
    WGPUDevice    mDevice;
    WGPUQueue     mQueue;
    SurfaceConfig mConfig;
    Extent2u      mSize;
    bool          mSurfaceConfigured;
};
} // namespace gtb
