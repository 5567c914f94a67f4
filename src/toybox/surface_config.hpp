#pragma once

#include <common/extent.hpp>

#include <webgpu/webgpu.h>

#include <cstdint>
#include <span>
#include <vector>

namespace gtb
{
// Bounds the number of frames the surface may queue ahead of presentation.
inline constexpr std::uint32_t MAX_FRAME_LATENCY = 2;

// What the platform reports it can do for an (adapter, surface) pair, in the platform's order of
// preference.
struct SurfaceCapabilities
{
    std::vector<WGPUTextureFormat>      formats;
    std::vector<WGPUPresentMode>        presentModes;
    std::vector<WGPUCompositeAlphaMode> alphaModes;
};

struct SurfaceConfig
{
    WGPUTextureFormat      format = WGPUTextureFormat_Undefined;
    std::uint32_t          width = 0;
    std::uint32_t          height = 0;
    WGPUPresentMode        presentMode = WGPUPresentMode_Fifo;
    WGPUCompositeAlphaMode alphaMode = WGPUCompositeAlphaMode_Auto;
    std::uint32_t          maxFrameLatency = MAX_FRAME_LATENCY;

    constexpr bool operator==(const SurfaceConfig&) const noexcept = default;
};

// True for the gamma-corrected (sRGB-encoded) color formats.
bool isSrgbFormat(WGPUTextureFormat format) noexcept;

// Picks the first sRGB format in the list, or the first format if the list has none. Throws
// std::invalid_argument for an empty list.
WGPUTextureFormat selectSurfaceFormat(std::span<const WGPUTextureFormat> formats);

// Builds the configuration from the capabilities: the selected format, the first present mode and
// the first alpha mode. Throws std::invalid_argument if any capability list is empty.
SurfaceConfig selectSurfaceConfig(const SurfaceCapabilities& capabilities, Extent2u size);

// Applies a new size to the configuration. Sizes with a zero dimension are rejected and leave the
// configuration untouched. Returns whether the configuration was updated.
bool resizeSurfaceConfig(SurfaceConfig& config, Extent2u newSize) noexcept;

constexpr Extent2u surfaceSize(const SurfaceConfig& config) noexcept
{
    return Extent2u{config.width, config.height};
}
} // namespace gtb
